#include "deteval/io/DatasetReader.hpp"
#include "deteval/eval/EvalError.hpp"
#include "deteval/common/StringUtils.hpp"
#include "deteval/common/log.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace deteval::io {

namespace {

std::string where(const std::string& source, size_t image_idx, const char* field, size_t item_idx) {
    std::ostringstream os;
    os << source << ": images[" << image_idx << "]." << field << "[" << item_idx << "]";
    return os.str();
}

eval::Box readBox(const YAML::Node& node, const std::string& ctx) {
    const YAML::Node box = node["box"];
    if (!box || !box.IsSequence() || box.size() != 4) {
        throw eval::DatasetError(ctx + ": 'box' must be a list [x1, y1, x2, y2]");
    }

    const double x1 = box[0].as<double>();
    const double y1 = box[1].as<double>();
    const double x2 = box[2].as<double>();
    const double y2 = box[3].as<double>();
    if (x2 < x1 || y2 < y1) {
        std::ostringstream os;
        os << ctx << ": box [" << x1 << ", " << y1 << ", " << x2 << ", " << y2
           << "] has x2 < x1 or y2 < y1";
        throw eval::DatasetError(os.str());
    }
    return eval::Box(x1, y1, x2 - x1, y2 - y1);
}

int readLabel(const YAML::Node& node, const std::string& ctx) {
    if (!node["label"]) {
        throw eval::DatasetError(ctx + ": missing 'label'");
    }
    return node["label"].as<int>();
}

eval::ImageRecord readImage(const YAML::Node& node, const std::string& source, size_t idx) {
    eval::ImageRecord image;
    image.image_id = node["id"] ? node["id"].as<std::string>() : "image_" + std::to_string(idx);

    const YAML::Node dets = node["detections"];
    if (dets && !dets.IsNull()) {
        if (!dets.IsSequence()) {
            throw eval::DatasetError(source + ": images[" + std::to_string(idx) +
                                     "].detections must be a list");
        }
        for (size_t i = 0; i < dets.size(); ++i) {
            const std::string ctx = where(source, idx, "detections", i);
            const YAML::Node d = dets[i];
            if (!d["score"]) {
                throw eval::DatasetError(ctx + ": missing 'score'");
            }
            image.detections.boxes.push_back(readBox(d, ctx));
            image.detections.labels.push_back(readLabel(d, ctx));
            image.detections.scores.push_back(d["score"].as<double>());
        }
    }

    const YAML::Node gts = node["ground_truth"];
    if (gts && !gts.IsNull()) {
        if (!gts.IsSequence()) {
            throw eval::DatasetError(source + ": images[" + std::to_string(idx) +
                                     "].ground_truth must be a list");
        }
        for (size_t i = 0; i < gts.size(); ++i) {
            const std::string ctx = where(source, idx, "ground_truth", i);
            image.ground_truth.boxes.push_back(readBox(gts[i], ctx));
            image.ground_truth.labels.push_back(readLabel(gts[i], ctx));
        }
    }

    return image;
}

} // namespace

std::vector<eval::ImageRecord> parseDataset(const YAML::Node& root, const std::string& source) {
    const YAML::Node images = root["images"];
    if (!images || !images.IsSequence()) {
        throw eval::DatasetError(source + ": expected a top-level 'images' list");
    }

    std::vector<eval::ImageRecord> records;
    records.reserve(images.size());
    for (size_t i = 0; i < images.size(); ++i) {
        try {
            records.push_back(readImage(images[i], source, i));
        } catch (const YAML::Exception& e) {
            throw eval::DatasetError(source + ": images[" + std::to_string(i) + "]: " + e.what());
        }
    }
    return records;
}

std::vector<eval::ImageRecord> loadDataset(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw eval::DatasetError("dataset file not found: " + path +
                                 (ec ? " (" + ec.message() + ")" : std::string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw eval::DatasetError("failed to parse dataset '" + path + "': " + e.what());
    }

    std::vector<eval::ImageRecord> records = parseDataset(root, path);
    LOGI("Loaded ", records.size(), " images from ", path);
    return records;
}

std::vector<std::string> loadClassNames(const std::string& path) {
    std::vector<std::string> class_names;
    std::ifstream file(path);

    if (!file.is_open()) {
        LOGE("Failed to open class names file: ", path);
        return class_names;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = common::trimCopy(line);
        if (!line.empty()) class_names.push_back(line);
    }

    LOGI("Loaded ", class_names.size(), " class names from ", path);
    return class_names;
}

int inferNumClasses(const std::vector<eval::ImageRecord>& images, size_t num_class_names) {
    const int64_t limit = num_class_names > 0 ? static_cast<int64_t>(num_class_names)
                                              : static_cast<int64_t>(kMaxInferredClasses);
    int64_t num_classes = 0;
    auto check = [&](const eval::ImageRecord& image, int label) {
        const int64_t count = static_cast<int64_t>(label) + 1;
        if (count > limit) {
            std::ostringstream os;
            os << "image '" << image.image_id << "': label " << label;
            if (num_class_names > 0) {
                os << " has no entry in the " << num_class_names << " class names";
            } else {
                os << " exceeds the limit of " << kMaxInferredClasses
                   << " classes; set num_classes explicitly";
            }
            throw eval::DatasetError(os.str());
        }
        num_classes = std::max(num_classes, count);
    };

    for (const auto& image : images) {
        for (int label : image.detections.labels) check(image, label);
        for (int label : image.ground_truth.labels) check(image, label);
    }
    return static_cast<int>(num_classes);
}

} // namespace deteval::io
