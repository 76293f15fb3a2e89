#pragma once

#include <cstdint>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::eval {

/**
 * @brief Dataset-wide collector for one class
 *
 * Match results are appended image by image. ranked() merges them into one
 * list sorted by descending score; ties keep the order they were added in.
 */
class RankAccumulator {
public:
    void add(const MatchResult& result);
    void reset();

    int64_t numGroundTruth() const { return num_ground_truth_; }
    int64_t numDetections() const { return static_cast<int64_t>(scores_.size()); }
    int64_t numTruePositives() const;

    ClassStatistics ranked() const;
    CumulativeCounts accumulate() const;

private:
    int64_t num_ground_truth_ = 0;
    std::vector<bool> true_positive_;
    std::vector<double> scores_;
};

} // namespace deteval::eval
