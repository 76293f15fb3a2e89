#include "deteval/eval/Overlap.hpp"
#include "deteval/eval/EvalError.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace deteval::eval {

double boxIou(const Box& a, const Box& b) {
    if (a.width <= 0.0 || a.height <= 0.0 || b.width <= 0.0 || b.height <= 0.0) {
        return 0.0;
    }

    const double inter_x1 = std::max(a.x, b.x);
    const double inter_y1 = std::max(a.y, b.y);
    const double inter_x2 = std::min(a.x + a.width, b.x + b.width);
    const double inter_y2 = std::min(a.y + a.height, b.y + b.height);

    if (inter_x1 >= inter_x2 || inter_y1 >= inter_y2) {
        return 0.0;
    }

    const double inter_area = (inter_x2 - inter_x1) * (inter_y2 - inter_y1);
    const double union_area = a.area() + b.area() - inter_area;
    if (union_area <= 0.0) {
        return 0.0;
    }
    // Rounding can push the ratio a hair past 1 for identical boxes.
    return std::min(1.0, inter_area / union_area);
}

cv::Mat1d pairwiseIou(const std::vector<Box>& a, const std::vector<Box>& b) {
    cv::Mat1d result(static_cast<int>(a.size()), static_cast<int>(b.size()), 0.0);
    for (int i = 0; i < result.rows; ++i) {
        double* row = result[i];
        for (int j = 0; j < result.cols; ++j) {
            row[j] = boxIou(a[static_cast<size_t>(i)], b[static_cast<size_t>(j)]);
        }
    }
    return result;
}

cv::Mat1d computeOverlaps(const OverlapFunction& overlap,
                          const std::vector<Box>& a,
                          const std::vector<Box>& b) {
    if (!overlap) {
        throw ValidationError("overlap function is not set");
    }

    cv::Mat1d m = overlap(a, b);
    if (m.rows != static_cast<int>(a.size()) || m.cols != static_cast<int>(b.size())) {
        throw NumericError("overlap matrix has shape " + std::to_string(m.rows) + "x" +
                           std::to_string(m.cols) + ", expected " +
                           std::to_string(a.size()) + "x" + std::to_string(b.size()));
    }

    for (int i = 0; i < m.rows; ++i) {
        const double* row = m[i];
        for (int j = 0; j < m.cols; ++j) {
            const double v = row[j];
            if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
                throw NumericError("overlap value " + std::to_string(v) + " at (" +
                                   std::to_string(i) + ", " + std::to_string(j) +
                                   ") is outside [0, 1]");
            }
        }
    }
    return m;
}

} // namespace deteval::eval
