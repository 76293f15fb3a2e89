#include "deteval/eval/PrecisionRecall.hpp"
#include "deteval/eval/EvalError.hpp"

#include <string>

namespace deteval::eval {

PrecisionRecallCurve computePrecisionRecall(const CumulativeCounts& counts,
                                            int64_t num_ground_truth) {
    if (counts.true_positives.size() != counts.false_positives.size()) {
        throw ValidationError("cumulative counts differ in length: tp=" +
                              std::to_string(counts.true_positives.size()) + ", fp=" +
                              std::to_string(counts.false_positives.size()));
    }

    PrecisionRecallCurve curve;
    if (num_ground_truth <= 0) {
        return curve;
    }

    const double denom = static_cast<double>(num_ground_truth);
    curve.reserve(counts.true_positives.size());
    for (size_t i = 0; i < counts.true_positives.size(); ++i) {
        const int64_t tp = counts.true_positives[i];
        const int64_t seen = tp + counts.false_positives[i];

        PrecisionRecallPoint point;
        point.recall = static_cast<double>(tp) / denom;
        point.precision = seen > 0 ? static_cast<double>(tp) / static_cast<double>(seen) : 0.0;
        curve.push_back(point);
    }
    return curve;
}

} // namespace deteval::eval
