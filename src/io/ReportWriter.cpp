#include "deteval/io/ReportWriter.hpp"
#include "deteval/eval/AveragePrecision.hpp"
#include "deteval/common/log.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace deteval::io {

void ReportWriter::logSummary(const eval::EvalResult& result) {
    LOGI("=== Evaluation Results ===");
    LOGI("Images: ", result.num_images, ", IoU threshold: ", result.iou_threshold,
         ", AP method: ", eval::apMethodName(result.ap_method));

    for (const auto& cls : result.classes) {
        std::ostringstream os;
        os << std::setw(4) << cls.class_id << "  "
           << std::left << std::setw(20) << (cls.name.empty() ? "-" : cls.name) << std::right
           << " AP=" << std::fixed << std::setprecision(4) << cls.average_precision
           << "  gt=" << cls.num_ground_truth
           << "  det=" << cls.num_detections
           << "  tp=" << cls.num_true_positives;
        LOGI(os.str());
    }

    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << result.mean_ap;
    LOGI("mAP = ", os.str());
}

std::string ReportWriter::toYaml(const eval::EvalResult& result) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "mean_ap" << YAML::Value << result.mean_ap;
    out << YAML::Key << "iou_threshold" << YAML::Value << result.iou_threshold;
    out << YAML::Key << "ap_method" << YAML::Value << eval::apMethodName(result.ap_method);
    out << YAML::Key << "num_images" << YAML::Value << static_cast<uint64_t>(result.num_images);
    out << YAML::Key << "classes" << YAML::Value << YAML::BeginSeq;
    for (const auto& cls : result.classes) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << cls.class_id;
        if (!cls.name.empty()) {
            out << YAML::Key << "name" << YAML::Value << cls.name;
        }
        out << YAML::Key << "ap" << YAML::Value << cls.average_precision;
        out << YAML::Key << "num_ground_truth" << YAML::Value << cls.num_ground_truth;
        out << YAML::Key << "num_detections" << YAML::Value << cls.num_detections;
        out << YAML::Key << "num_true_positives" << YAML::Value << cls.num_true_positives;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

bool ReportWriter::write(const eval::EvalResult& result, const std::string& path) {
    const std::filesystem::path out_path(path);
    if (out_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(out_path.parent_path(), ec);
        if (ec) {
            LOGE("Cannot create report directory ", out_path.parent_path().string(), ": ", ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        LOGE("Failed to open report file: ", path);
        return false;
    }
    file << toYaml(result) << "\n";
    if (!file.good()) {
        LOGE("Failed to write report file: ", path);
        return false;
    }

    LOGI("Report written to ", path);
    return true;
}

} // namespace deteval::io
