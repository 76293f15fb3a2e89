#pragma once

#include <vector>

#include "deteval/eval/EvalTypes.hpp"
#include "deteval/eval/Overlap.hpp"

namespace deteval::eval {

/**
 * @brief Score-ordered greedy assignment of detections to ground truths
 *
 * Detections are visited from highest to lowest score (ties keep input order).
 * Each one looks only at its best-overlapping ground truth: it becomes a true
 * positive when that overlap reaches the threshold and no earlier detection
 * claimed the same ground truth, otherwise it is a false positive.
 */
class GreedyMatcher {
public:
    explicit GreedyMatcher(double iou_threshold = 0.5,
                           OverlapFunction overlap = pairwiseIou);

    MatchResult match(const ClassSlice& slice) const;

    double iouThreshold() const { return iou_threshold_; }

    // Indices of scores sorted descending, stable on ties.
    static std::vector<size_t> rankByScore(const std::vector<double>& scores);

private:
    double iou_threshold_;
    OverlapFunction overlap_;
};

} // namespace deteval::eval
