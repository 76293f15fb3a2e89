#pragma once

#include <functional>
#include <vector>
#include <opencv2/core.hpp>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::eval {

/**
 * @brief Pairwise overlap between two box sets
 * @return |a| x |b| matrix, entry (i, j) is overlap(a[i], b[j]) in [0, 1]
 */
using OverlapFunction =
    std::function<cv::Mat1d(const std::vector<Box>& a, const std::vector<Box>& b)>;

/**
 * @brief Intersection over union of two boxes
 * @details Boxes without positive union area overlap nothing (0).
 */
double boxIou(const Box& a, const Box& b);

// Default OverlapFunction built on boxIou.
cv::Mat1d pairwiseIou(const std::vector<Box>& a, const std::vector<Box>& b);

/**
 * @brief Runs an overlap function and checks its output
 * @throws NumericError if the matrix has the wrong shape or a value outside [0, 1]
 */
cv::Mat1d computeOverlaps(const OverlapFunction& overlap,
                          const std::vector<Box>& a,
                          const std::vector<Box>& b);

} // namespace deteval::eval
