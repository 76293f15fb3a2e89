#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "deteval/common/log.hpp"
#include "deteval/config/AppConfig.hpp"
#include "deteval/eval/AveragePrecision.hpp"
#include "deteval/eval/EvalError.hpp"
#include "deteval/eval/MapEvaluator.hpp"
#include "deteval/io/DatasetReader.hpp"
#include "deteval/io/ReportWriter.hpp"

namespace {

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --cfg <path>          Configuration file (default: config/eval.yaml)\n";
    std::cout << "  --dataset <file>      Dataset YAML with detections and ground truth\n";
    std::cout << "  --report <file>       Write a YAML report to this file\n";
    std::cout << "  --iou <t>             IoU threshold for a match (default: 0.5)\n";
    std::cout << "  --num-classes <n>     Number of classes\n";
    std::cout << "  --ap-method <m>       eleven_point | all_points\n";
    std::cout << "  --parallel            Evaluate classes in parallel\n";
    std::cout << "  --log-level <lvl>     Set log level (TRACE/DEBUG/INFO/WARN/ERROR)\n";
    std::cout << "  --help                Show this help message\n";
}

bool parseDouble(const std::string& text, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& text, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

struct CliOverrides {
    std::string dataset_path;
    std::string report_path;
    std::string log_level;
    std::string ap_method;
    bool has_iou = false;
    double iou = 0.5;
    int num_classes = 0;
    bool parallel = false;
};

}  // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/eval.yaml";
    CliOverrides cli;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--cfg" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--dataset" && i + 1 < argc) {
            cli.dataset_path = argv[++i];
        } else if (arg == "--report" && i + 1 < argc) {
            cli.report_path = argv[++i];
        } else if (arg == "--iou" && i + 1 < argc) {
            const std::string value = argv[++i];
            if (!parseDouble(value, cli.iou)) {
                LOGE("Invalid --iou value: ", value);
                return 1;
            }
            cli.has_iou = true;
        } else if (arg == "--num-classes" && i + 1 < argc) {
            const std::string value = argv[++i];
            if (!parseInt(value, cli.num_classes)) {
                LOGE("Invalid --num-classes value: ", value);
                return 1;
            }
        } else if (arg == "--ap-method" && i + 1 < argc) {
            cli.ap_method = argv[++i];
        } else if (arg == "--parallel") {
            cli.parallel = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            LOGE("Unknown argument: ", arg);
            printUsage(argv[0]);
            return 1;
        }
    }

    // Apply the CLI log level first so config loading honours it.
    if (!cli.log_level.empty()) {
        evlog::setLevel(deteval::config::parseLogLevel(cli.log_level));
    }

    deteval::config::AppConfig config = deteval::config::loadConfig(config_path);

    if (!cli.dataset_path.empty()) config.dataset_path = cli.dataset_path;
    if (!cli.report_path.empty()) config.report_path = cli.report_path;
    if (!cli.log_level.empty()) config.log_level = cli.log_level;
    if (cli.has_iou) config.iou_threshold = cli.iou;
    if (cli.num_classes > 0) config.num_classes = cli.num_classes;
    if (cli.parallel) config.parallel = true;
    if (!cli.ap_method.empty() &&
        !deteval::eval::parseApMethod(cli.ap_method, config.ap_method)) {
        LOGE("Unknown AP method: ", cli.ap_method);
        return 1;
    }

    evlog::setLevel(deteval::config::parseLogLevel(config.log_level));

    if (config.dataset_path.empty()) {
        LOGE("No dataset given; set dataset.path in ", config_path, " or pass --dataset");
        printUsage(argv[0]);
        return 1;
    }

    try {
        std::vector<std::string> class_names = config.inline_class_names;
        if (class_names.empty() && !config.classes_path.empty()) {
            class_names = deteval::io::loadClassNames(config.classes_path);
        }

        const std::vector<deteval::eval::ImageRecord> images =
            deteval::io::loadDataset(config.dataset_path);

        deteval::eval::EvaluatorConfig eval_config = deteval::config::toEvaluatorConfig(config);
        if (eval_config.num_classes <= 0) {
            const int inferred = deteval::io::inferNumClasses(images, class_names.size());
            eval_config.num_classes = !class_names.empty()
                ? static_cast<int>(class_names.size())
                : inferred;
            LOGI("num_classes not set, using ", eval_config.num_classes);
        }
        if (class_names.size() == static_cast<size_t>(eval_config.num_classes)) {
            eval_config.class_names = class_names;
        } else if (!class_names.empty()) {
            LOGW("Ignoring ", class_names.size(), " class names for ",
                 eval_config.num_classes, " classes");
        }

        LOGI("=== Detection mAP Evaluation ===");
        LOGI("Dataset: ", config.dataset_path);
        LOGI("Classes: ", eval_config.num_classes, ", IoU threshold: ", eval_config.iou_threshold,
             ", AP method: ", deteval::eval::apMethodName(eval_config.ap_method),
             (eval_config.parallel ? ", parallel" : ""));

        deteval::eval::MapEvaluator evaluator(eval_config);
        evaluator.addImages(images);
        const deteval::eval::EvalResult result = evaluator.evaluate();

        deteval::io::ReportWriter::logSummary(result);
        if (!config.report_path.empty() &&
            !deteval::io::ReportWriter::write(result, config.report_path)) {
            return 1;
        }
    } catch (const deteval::eval::EvalError& e) {
        LOGE("Evaluation failed: ", e.what());
        return 1;
    } catch (const YAML::Exception& e) {
        LOGE("Evaluation failed: ", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOGE("Evaluation failed: ", e.what());
        return 1;
    }

    return 0;
}
