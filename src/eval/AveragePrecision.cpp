#include "deteval/eval/AveragePrecision.hpp"
#include "deteval/common/StringUtils.hpp"

#include <algorithm>

namespace deteval::eval {

namespace {

constexpr int kRecallLevels = 11;

} // namespace

double elevenPointAp(const PrecisionRecallCurve& curve) {
    double sum = 0.0;
    for (int k = 0; k < kRecallLevels; ++k) {
        const double t = static_cast<double>(k) / 10.0;

        // Max precision over points with recall strictly above t. When none
        // is above but some point sits exactly on t (full recall at t = 1.0,
        // or a curve topping out on a grid level), those points count.
        double above = 0.0;
        double at = 0.0;
        bool any_above = false;
        for (const auto& point : curve) {
            if (point.recall > t) {
                above = std::max(above, point.precision);
                any_above = true;
            } else if (point.recall == t) {
                at = std::max(at, point.precision);
            }
        }
        sum += any_above ? above : at;
    }
    return sum / static_cast<double>(kRecallLevels);
}

double allPointsAp(const PrecisionRecallCurve& curve) {
    if (curve.empty()) {
        return 0.0;
    }

    // Sentinels at recall 0 and 1 close the step curve.
    std::vector<double> recall;
    std::vector<double> precision;
    recall.reserve(curve.size() + 2);
    precision.reserve(curve.size() + 2);
    recall.push_back(0.0);
    precision.push_back(0.0);
    for (const auto& point : curve) {
        recall.push_back(point.recall);
        precision.push_back(point.precision);
    }
    recall.push_back(1.0);
    precision.push_back(0.0);

    for (size_t i = precision.size() - 1; i > 0; --i) {
        precision[i - 1] = std::max(precision[i - 1], precision[i]);
    }

    double ap = 0.0;
    for (size_t i = 1; i < recall.size(); ++i) {
        if (recall[i] != recall[i - 1]) {
            ap += (recall[i] - recall[i - 1]) * precision[i];
        }
    }
    return std::clamp(ap, 0.0, 1.0);
}

double averagePrecision(const PrecisionRecallCurve& curve, ApMethod method) {
    switch (method) {
        case ApMethod::ALL_POINTS: return allPointsAp(curve);
        case ApMethod::ELEVEN_POINT:
        default: return elevenPointAp(curve);
    }
}

double meanAveragePrecision(const std::vector<double>& ap_per_class) {
    if (ap_per_class.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (double ap : ap_per_class) {
        sum += ap;
    }
    return sum / static_cast<double>(ap_per_class.size());
}

const char* apMethodName(ApMethod method) {
    switch (method) {
        case ApMethod::ALL_POINTS: return "all_points";
        case ApMethod::ELEVEN_POINT:
        default: return "eleven_point";
    }
}

bool parseApMethod(const std::string& name, ApMethod& out) {
    const std::string lower = common::toLowerCopy(common::trimCopy(name));
    if (lower == "eleven_point" || lower == "11point" || lower == "voc2007") {
        out = ApMethod::ELEVEN_POINT;
        return true;
    }
    if (lower == "all_points" || lower == "voc2012") {
        out = ApMethod::ALL_POINTS;
        return true;
    }
    return false;
}

} // namespace deteval::eval
