#include "deteval/eval/RankAccumulator.hpp"
#include "deteval/eval/GreedyMatcher.hpp"

#include <algorithm>

namespace deteval::eval {

void RankAccumulator::add(const MatchResult& result) {
    num_ground_truth_ += result.num_ground_truth;
    true_positive_.insert(true_positive_.end(),
                          result.true_positive.begin(), result.true_positive.end());
    scores_.insert(scores_.end(), result.scores.begin(), result.scores.end());
}

void RankAccumulator::reset() {
    num_ground_truth_ = 0;
    true_positive_.clear();
    scores_.clear();
}

int64_t RankAccumulator::numTruePositives() const {
    return static_cast<int64_t>(std::count(true_positive_.begin(), true_positive_.end(), true));
}

ClassStatistics RankAccumulator::ranked() const {
    ClassStatistics stats;
    stats.num_ground_truth = num_ground_truth_;

    const std::vector<size_t> order = GreedyMatcher::rankByScore(scores_);
    stats.true_positive.reserve(order.size());
    stats.scores.reserve(order.size());
    for (size_t idx : order) {
        stats.true_positive.push_back(true_positive_[idx]);
        stats.scores.push_back(scores_[idx]);
    }
    return stats;
}

CumulativeCounts RankAccumulator::accumulate() const {
    const ClassStatistics stats = ranked();

    CumulativeCounts counts;
    counts.true_positives.reserve(stats.true_positive.size());
    counts.false_positives.reserve(stats.true_positive.size());

    int64_t tp = 0;
    int64_t fp = 0;
    for (bool is_tp : stats.true_positive) {
        if (is_tp) {
            ++tp;
        } else {
            ++fp;
        }
        counts.true_positives.push_back(tp);
        counts.false_positives.push_back(fp);
    }
    return counts;
}

} // namespace deteval::eval
