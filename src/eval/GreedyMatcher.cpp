#include "deteval/eval/GreedyMatcher.hpp"
#include "deteval/eval/Validation.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace deteval::eval {

GreedyMatcher::GreedyMatcher(double iou_threshold, OverlapFunction overlap)
    : iou_threshold_(iou_threshold), overlap_(std::move(overlap)) {
    validateOptions(1, iou_threshold_);
}

std::vector<size_t> GreedyMatcher::rankByScore(const std::vector<double>& scores) {
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&scores](size_t a, size_t b) {
            return scores[a] > scores[b];
        });
    return order;
}

MatchResult GreedyMatcher::match(const ClassSlice& slice) const {
    MatchResult result;
    result.num_ground_truth = static_cast<int64_t>(slice.ground_truth_boxes.size());

    const std::vector<size_t> order = rankByScore(slice.detection_scores);
    result.true_positive.assign(order.size(), false);
    result.scores.reserve(order.size());
    for (size_t idx : order) {
        result.scores.push_back(slice.detection_scores[idx]);
    }

    if (order.empty() || slice.ground_truth_boxes.empty()) {
        return result;
    }

    const cv::Mat1d ious = computeOverlaps(overlap_, slice.detection_boxes,
                                           slice.ground_truth_boxes);
    std::vector<bool> claimed(slice.ground_truth_boxes.size(), false);

    for (size_t rank = 0; rank < order.size(); ++rank) {
        const double* row = ious[static_cast<int>(order[rank])];
        const double* best = std::max_element(row, row + ious.cols);
        const size_t gt_match = static_cast<size_t>(best - row);

        if (*best >= iou_threshold_ && !claimed[gt_match]) {
            result.true_positive[rank] = true;
            claimed[gt_match] = true;
        }
    }

    return result;
}

} // namespace deteval::eval
