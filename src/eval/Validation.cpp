#include "deteval/eval/Validation.hpp"
#include "deteval/eval/EvalError.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace deteval::eval {

namespace {

std::string describe(const ImageRecord& image) {
    return image.image_id.empty() ? std::string("<unnamed image>") : "'" + image.image_id + "'";
}

bool isFiniteBox(const Box& box) {
    return std::isfinite(box.x) && std::isfinite(box.y) &&
           std::isfinite(box.width) && std::isfinite(box.height);
}

void checkLabels(const std::vector<int>& labels, int num_classes,
                 const ImageRecord& image, const char* what) {
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] < 0 || labels[i] >= num_classes) {
            std::ostringstream os;
            os << "image " << describe(image) << ": " << what << " " << i
               << " has label " << labels[i] << " outside [0, " << num_classes << ")";
            throw ValidationError(os.str());
        }
    }
}

void checkBoxes(const std::vector<Box>& boxes, const ImageRecord& image, const char* what) {
    for (size_t i = 0; i < boxes.size(); ++i) {
        if (!isFiniteBox(boxes[i])) {
            std::ostringstream os;
            os << "image " << describe(image) << ": " << what << " " << i
               << " has a non-finite box coordinate";
            throw NumericError(os.str());
        }
    }
}

} // namespace

void validateOptions(int num_classes, double iou_threshold) {
    if (num_classes < 1) {
        throw ValidationError("num_classes must be at least 1, got " + std::to_string(num_classes));
    }
    if (!std::isfinite(iou_threshold)) {
        throw NumericError("IoU threshold is not finite");
    }
    if (iou_threshold < 0.0 || iou_threshold > 1.0) {
        throw ValidationError("IoU threshold " + std::to_string(iou_threshold) +
                              " is outside [0, 1]");
    }
}

void validateImage(const ImageRecord& image, int num_classes) {
    const Detections& det = image.detections;
    const GroundTruths& gt = image.ground_truth;

    if (det.boxes.size() != det.scores.size() || det.boxes.size() != det.labels.size()) {
        std::ostringstream os;
        os << "image " << describe(image) << ": detection arrays differ in length (boxes="
           << det.boxes.size() << ", scores=" << det.scores.size()
           << ", labels=" << det.labels.size() << ")";
        throw ValidationError(os.str());
    }
    if (gt.boxes.size() != gt.labels.size()) {
        std::ostringstream os;
        os << "image " << describe(image) << ": ground-truth arrays differ in length (boxes="
           << gt.boxes.size() << ", labels=" << gt.labels.size() << ")";
        throw ValidationError(os.str());
    }

    checkLabels(det.labels, num_classes, image, "detection");
    checkLabels(gt.labels, num_classes, image, "ground truth");

    for (size_t i = 0; i < det.scores.size(); ++i) {
        if (!std::isfinite(det.scores[i])) {
            std::ostringstream os;
            os << "image " << describe(image) << ": detection " << i
               << " has a non-finite score";
            throw NumericError(os.str());
        }
    }
    checkBoxes(det.boxes, image, "detection");
    checkBoxes(gt.boxes, image, "ground truth");
}

void validateBatch(const std::vector<ImageRecord>& images, int num_classes) {
    for (const auto& image : images) {
        validateImage(image, num_classes);
    }
}

} // namespace deteval::eval
