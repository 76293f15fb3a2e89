#include "deteval/eval/MapEvaluator.hpp"
#include "deteval/eval/AveragePrecision.hpp"
#include "deteval/eval/ClassPartitioner.hpp"
#include "deteval/eval/EvalError.hpp"
#include "deteval/eval/PrecisionRecall.hpp"
#include "deteval/eval/Validation.hpp"
#include "deteval/common/log.hpp"

#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core/utility.hpp>

namespace deteval::eval {

namespace {

// Runs fn(c) for every class. Each call must touch only slot c of its
// outputs. Exceptions are carried out of the worker and rethrown here,
// lowest class first.
void forEachClass(int num_classes, bool parallel, const std::function<void(int)>& fn) {
    if (!parallel || num_classes < 2) {
        for (int c = 0; c < num_classes; ++c) {
            fn(c);
        }
        return;
    }

    std::vector<std::exception_ptr> errors(static_cast<size_t>(num_classes));
    cv::parallel_for_(cv::Range(0, num_classes), [&](const cv::Range& range) {
        for (int c = range.start; c < range.end; ++c) {
            try {
                fn(c);
            } catch (...) {
                errors[static_cast<size_t>(c)] = std::current_exception();
            }
        }
    });

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

} // namespace

MapEvaluator::MapEvaluator(const EvaluatorConfig& config, OverlapFunction overlap)
    : config_(config),
      matcher_(config.iou_threshold, std::move(overlap)) {
    validateOptions(config_.num_classes, config_.iou_threshold);
    if (!config_.class_names.empty() &&
        config_.class_names.size() != static_cast<size_t>(config_.num_classes)) {
        throw ValidationError("got " + std::to_string(config_.class_names.size()) +
                              " class names for " + std::to_string(config_.num_classes) +
                              " classes");
    }
    accumulators_.resize(static_cast<size_t>(config_.num_classes));
}

std::vector<MatchResult> MapEvaluator::matchImage(const ImageRecord& image) const {
    std::vector<MatchResult> matches(static_cast<size_t>(config_.num_classes));
    for (int c = 0; c < config_.num_classes; ++c) {
        matches[static_cast<size_t>(c)] = matcher_.match(ClassPartitioner::partition(image, c));
    }
    return matches;
}

void MapEvaluator::addImage(const ImageRecord& image) {
    validateImage(image, config_.num_classes);

    std::vector<MatchResult> matches = matchImage(image);
    for (size_t c = 0; c < matches.size(); ++c) {
        accumulators_[c].add(matches[c]);
    }
    ++num_images_;

    LOGT("Matched image ", image.image_id, ": ", image.detections.boxes.size(),
         " detections, ", image.ground_truth.boxes.size(), " ground truths");
}

void MapEvaluator::addImages(const std::vector<ImageRecord>& images) {
    validateBatch(images, config_.num_classes);

    // matches[c][i] is class c on image i
    std::vector<std::vector<MatchResult>> matches(static_cast<size_t>(config_.num_classes));
    forEachClass(config_.num_classes, config_.parallel, [&](int c) {
        auto& per_image = matches[static_cast<size_t>(c)];
        per_image.reserve(images.size());
        for (const auto& image : images) {
            per_image.push_back(matcher_.match(ClassPartitioner::partition(image, c)));
        }
    });

    for (size_t c = 0; c < matches.size(); ++c) {
        for (const auto& match : matches[c]) {
            accumulators_[c].add(match);
        }
    }
    num_images_ += images.size();

    LOGD("Matched batch of ", images.size(), " images (", num_images_, " total)");
}

EvalResult MapEvaluator::evaluate() const {
    EvalResult result;
    result.iou_threshold = config_.iou_threshold;
    result.ap_method = config_.ap_method;
    result.num_images = num_images_;
    result.ap_per_class.assign(static_cast<size_t>(config_.num_classes), 0.0);
    result.classes.resize(static_cast<size_t>(config_.num_classes));

    forEachClass(config_.num_classes, config_.parallel, [&](int c) {
        const RankAccumulator& acc = accumulators_[static_cast<size_t>(c)];
        ClassResult& cls = result.classes[static_cast<size_t>(c)];
        cls.class_id = c;
        if (!config_.class_names.empty()) {
            cls.name = config_.class_names[static_cast<size_t>(c)];
        }
        cls.num_ground_truth = acc.numGroundTruth();
        cls.num_detections = acc.numDetections();
        cls.num_true_positives = acc.numTruePositives();

        // No ground truth or no detections: AP stays 0.
        if (cls.num_ground_truth > 0 && cls.num_detections > 0) {
            const PrecisionRecallCurve curve =
                computePrecisionRecall(acc.accumulate(), cls.num_ground_truth);
            cls.average_precision = averagePrecision(curve, config_.ap_method);
        }
        result.ap_per_class[static_cast<size_t>(c)] = cls.average_precision;
    });

    result.mean_ap = meanAveragePrecision(result.ap_per_class);

    for (const auto& cls : result.classes) {
        LOGD("class ", cls.class_id, (cls.name.empty() ? "" : " (" + cls.name + ")"),
             ": AP=", cls.average_precision, " gt=", cls.num_ground_truth,
             " det=", cls.num_detections, " tp=", cls.num_true_positives);
    }
    LOGI("mAP@", config_.iou_threshold, " = ", result.mean_ap, " over ",
         config_.num_classes, " classes, ", num_images_, " images");
    return result;
}

void MapEvaluator::reset() {
    for (auto& acc : accumulators_) {
        acc.reset();
    }
    num_images_ = 0;
}

EvalResult computeMap(const std::vector<ImageRecord>& images,
                      int num_classes,
                      double iou_threshold) {
    EvaluatorConfig config;
    config.num_classes = num_classes;
    config.iou_threshold = iou_threshold;

    MapEvaluator evaluator(config);
    evaluator.addImages(images);
    return evaluator.evaluate();
}

} // namespace deteval::eval
