#pragma once

#include <vector>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::eval {

/**
 * @brief Checks one image before it reaches the matcher
 * @throws ValidationError on length mismatch or a label outside [0, num_classes)
 * @throws NumericError on a non-finite score or box coordinate
 */
void validateImage(const ImageRecord& image, int num_classes);

// Validates every image; the first failure aborts the whole batch.
void validateBatch(const std::vector<ImageRecord>& images, int num_classes);

// num_classes >= 1 and a finite IoU threshold in [0, 1].
void validateOptions(int num_classes, double iou_threshold);

} // namespace deteval::eval
