#include "deteval/config/AppConfig.hpp"
#include "deteval/eval/AveragePrecision.hpp"

#include <filesystem>
#include <system_error>

namespace deteval::config {

evlog::Level parseLogLevel(const std::string& level_name) {
    evlog::Level level = evlog::INFO;
    if (!evlog::parseLevel(level_name, level)) {
        LOGW("Unknown log level '", level_name, "', defaulting to INFO");
        return evlog::INFO;
    }
    return level;
}

AppConfig applyYaml(const YAML::Node& yaml, AppConfig config) {
    if (yaml["dataset"]) {
        const auto& dataset = yaml["dataset"];
        if (dataset.IsScalar()) {
            config.dataset_path = dataset.as<std::string>();
        } else if (dataset["path"]) {
            config.dataset_path = dataset["path"].as<std::string>(config.dataset_path);
        }
    }

    if (yaml["evaluation"]) {
        const auto& ev = yaml["evaluation"];
        if (ev["num_classes"]) config.num_classes = ev["num_classes"].as<int>(config.num_classes);
        if (ev["iou_threshold"]) config.iou_threshold = ev["iou_threshold"].as<double>(config.iou_threshold);
        if (ev["parallel"]) config.parallel = ev["parallel"].as<bool>(config.parallel);
        if (ev["ap_method"]) {
            const std::string name = ev["ap_method"].as<std::string>();
            if (!eval::parseApMethod(name, config.ap_method)) {
                LOGW("Unknown ap_method '", name, "', keeping ", eval::apMethodName(config.ap_method));
            }
        }
    }

    if (yaml["classes"]) {
        const auto& cls = yaml["classes"];
        if (cls.IsScalar()) {
            config.classes_path = cls.as<std::string>();
            config.inline_class_names.clear();
        } else if (cls.IsSequence()) {
            config.classes_path.clear();
            config.inline_class_names.clear();
            for (const auto& node : cls) {
                config.inline_class_names.push_back(node.as<std::string>());
            }
        } else if (cls.IsMap()) {
            if (cls["path"]) {
                config.classes_path = cls["path"].as<std::string>();
            }
            if (cls["names"] && cls["names"].IsSequence()) {
                config.inline_class_names.clear();
                for (const auto& node : cls["names"]) {
                    config.inline_class_names.push_back(node.as<std::string>());
                }
                if (!cls["path"]) {
                    config.classes_path.clear();
                }
            }
        }
    }

    if (yaml["report"]) {
        const auto& report = yaml["report"];
        if (report.IsScalar()) {
            config.report_path = report.as<std::string>();
        } else if (report["path"]) {
            config.report_path = report["path"].as<std::string>(config.report_path);
        }
    }

    if (yaml["logging"]) {
        const auto& logging = yaml["logging"];
        if (logging["level"]) {
            config.log_level = logging["level"].as<std::string>(config.log_level);
        }
    } else if (yaml["log_level"]) {
        config.log_level = yaml["log_level"].as<std::string>(config.log_level);
    }

    return config;
}

eval::EvaluatorConfig toEvaluatorConfig(const AppConfig& config) {
    eval::EvaluatorConfig eval_config;
    eval_config.num_classes = config.num_classes;
    eval_config.iou_threshold = config.iou_threshold;
    eval_config.ap_method = config.ap_method;
    eval_config.parallel = config.parallel;
    return eval_config;
}

AppConfig loadConfig(const std::string& config_path) {
    AppConfig config;

    try {
        std::error_code ec;
        if (std::filesystem::exists(config_path, ec)) {
            config = applyYaml(YAML::LoadFile(config_path), config);
            LOGI("Loaded configuration from ", config_path);
        } else {
            LOGW("Configuration file not found: ", config_path, ", using defaults");
        }
    } catch (const YAML::Exception& e) {
        LOGE("Error loading config '", config_path, "': ", e.what(), ", using defaults");
        config = AppConfig();
    }

    return config;
}

} // namespace deteval::config
