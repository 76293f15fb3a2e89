#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace deteval::eval {

// Axis-aligned box, (x, y) is the top-left corner.
using Box = cv::Rect2d;

/**
 * @brief Detector output for one image
 * @details boxes, scores and labels are parallel arrays.
 */
struct Detections {
    std::vector<Box> boxes;
    std::vector<double> scores;   // used only for ranking, any finite value
    std::vector<int> labels;      // class index in [0, num_classes)
};

/**
 * @brief Annotated objects for one image
 */
struct GroundTruths {
    std::vector<Box> boxes;
    std::vector<int> labels;
};

/**
 * @brief One image of an evaluation batch
 */
struct ImageRecord {
    std::string image_id;         // traceability only
    Detections detections;
    GroundTruths ground_truth;
};

/**
 * @brief Detections and ground truths of a single class on a single image
 */
struct ClassSlice {
    std::vector<Box> detection_boxes;
    std::vector<double> detection_scores;
    std::vector<Box> ground_truth_boxes;
};

/**
 * @brief Greedy matching outcome for one (class, image) pair
 * @details Both arrays are in descending score order and stay aligned.
 */
struct MatchResult {
    std::vector<bool> true_positive;
    std::vector<double> scores;
    int64_t num_ground_truth = 0;
};

/**
 * @brief Dataset-wide ranked labels of one class
 */
struct ClassStatistics {
    int64_t num_ground_truth = 0;
    std::vector<bool> true_positive;
    std::vector<double> scores;
};

struct CumulativeCounts {
    std::vector<int64_t> true_positives;
    std::vector<int64_t> false_positives;
};

struct PrecisionRecallPoint {
    double precision = 0.0;
    double recall = 0.0;
};

// Ordered by increasing rank cutoff.
using PrecisionRecallCurve = std::vector<PrecisionRecallPoint>;

enum class ApMethod {
    ELEVEN_POINT,   // VOC2007 11-point interpolation
    ALL_POINTS      // VOC2012 area under the precision envelope
};

struct ClassResult {
    int class_id = 0;
    std::string name;
    double average_precision = 0.0;
    int64_t num_ground_truth = 0;
    int64_t num_detections = 0;
    int64_t num_true_positives = 0;
};

struct EvalResult {
    double mean_ap = 0.0;
    std::vector<double> ap_per_class;
    std::vector<ClassResult> classes;
    double iou_threshold = 0.5;
    ApMethod ap_method = ApMethod::ELEVEN_POINT;
    size_t num_images = 0;
};

} // namespace deteval::eval
