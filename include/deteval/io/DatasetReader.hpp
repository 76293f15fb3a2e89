#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::io {

/**
 * @brief Reads detector output and annotations from a YAML dataset file
 *
 * Layout:
 * @code
 *   images:
 *     - id: "000001.jpg"
 *       detections:   [ { box: [x1, y1, x2, y2], label: 0, score: 0.9 } ]
 *       ground_truth: [ { box: [x1, y1, x2, y2], label: 0 } ]
 * @endcode
 *
 * @throws eval::DatasetError if the file is missing or malformed
 */
std::vector<eval::ImageRecord> loadDataset(const std::string& path);

// Same as loadDataset for an already parsed document; source names it in errors.
std::vector<eval::ImageRecord> parseDataset(const YAML::Node& root, const std::string& source);

// One class name per line, blank lines skipped. Empty on failure.
std::vector<std::string> loadClassNames(const std::string& path);

// Upper bound on a class count taken from dataset labels.
constexpr int kMaxInferredClasses = 100000;

/**
 * @brief 1 + the largest label seen in detections or ground truth, 0 for no labels
 * @param num_class_names when non-zero, every label must index into the class names
 * @throws eval::DatasetError naming the image and label that exceed
 *         num_class_names, or kMaxInferredClasses when no names are given
 */
int inferNumClasses(const std::vector<eval::ImageRecord>& images, size_t num_class_names = 0);

} // namespace deteval::io
