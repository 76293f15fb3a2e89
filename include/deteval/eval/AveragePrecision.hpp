#pragma once

#include <string>
#include <vector>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::eval {

/**
 * @brief 11-point interpolated AP (PASCAL VOC2007)
 * @details For t = 0.0, 0.1, ..., 1.0 the interpolated precision is the best
 *          precision among points with recall > t. If no point exceeds t,
 *          points with recall == t are used instead, and 0 when recall never
 *          gets there. AP is the sum of the 11 values divided by 11.
 */
double elevenPointAp(const PrecisionRecallCurve& curve);

/**
 * @brief Area under the monotone precision envelope (PASCAL VOC2012)
 */
double allPointsAp(const PrecisionRecallCurve& curve);

double averagePrecision(const PrecisionRecallCurve& curve, ApMethod method);

// Arithmetic mean over every class, zero-AP classes included.
double meanAveragePrecision(const std::vector<double>& ap_per_class);

const char* apMethodName(ApMethod method);
bool parseApMethod(const std::string& name, ApMethod& out);

} // namespace deteval::eval
