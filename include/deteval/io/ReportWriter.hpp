#pragma once

#include <string>

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::io {

class ReportWriter {
public:
    // Per-class AP table followed by the mAP line, at INFO level.
    static void logSummary(const eval::EvalResult& result);

    static std::string toYaml(const eval::EvalResult& result);

    /**
     * @brief Writes the YAML report
     * @return false (and logs) if the file cannot be written
     */
    static bool write(const eval::EvalResult& result, const std::string& path);
};

} // namespace deteval::io
