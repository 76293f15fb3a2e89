#include "deteval/eval/ClassPartitioner.hpp"

namespace deteval::eval {

ClassSlice ClassPartitioner::partition(const ImageRecord& image, int class_id) {
    ClassSlice slice;

    const Detections& det = image.detections;
    for (size_t i = 0; i < det.labels.size(); ++i) {
        if (det.labels[i] != class_id) continue;
        slice.detection_boxes.push_back(det.boxes[i]);
        slice.detection_scores.push_back(det.scores[i]);
    }

    const GroundTruths& gt = image.ground_truth;
    for (size_t i = 0; i < gt.labels.size(); ++i) {
        if (gt.labels[i] == class_id) {
            slice.ground_truth_boxes.push_back(gt.boxes[i]);
        }
    }

    return slice;
}

} // namespace deteval::eval
