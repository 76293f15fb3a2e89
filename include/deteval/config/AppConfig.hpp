#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "deteval/common/log.hpp"
#include "deteval/eval/EvalTypes.hpp"
#include "deteval/eval/MapEvaluator.hpp"

namespace deteval::config {

/**
 * @brief Settings of the deteval command line tool
 */
struct AppConfig {
    std::string dataset_path;
    std::string report_path;

    int num_classes = 0;              // 0: take it from class names or the dataset
    double iou_threshold = 0.5;
    eval::ApMethod ap_method = eval::ApMethod::ELEVEN_POINT;
    bool parallel = false;

    std::string classes_path;
    std::vector<std::string> inline_class_names;

    std::string log_level = "INFO";
};

/**
 * @brief Loads config from a YAML file
 * @details A missing file or a parse error is logged and defaults are used.
 */
AppConfig loadConfig(const std::string& config_path);

// Applies the keys present in yaml on top of base.
AppConfig applyYaml(const YAML::Node& yaml, AppConfig base = AppConfig());

// Evaluation settings of config; class names are left to the caller.
eval::EvaluatorConfig toEvaluatorConfig(const AppConfig& config);

// Unknown names log a warning and give INFO.
evlog::Level parseLogLevel(const std::string& level_name);

} // namespace deteval::config
