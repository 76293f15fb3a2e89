#pragma once

#include <cstdint>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::eval {

/**
 * @brief Precision and recall at every rank cutoff
 * @param counts cumulative TP/FP counts, equal length
 * @param num_ground_truth recall denominator
 * @return empty curve when num_ground_truth is 0 (recall undefined)
 * @throws ValidationError if the count arrays differ in length
 */
PrecisionRecallCurve computePrecisionRecall(const CumulativeCounts& counts,
                                            int64_t num_ground_truth);

} // namespace deteval::eval
