#pragma once

#include <stdexcept>
#include <string>

namespace deteval::eval {

class EvalError : public std::runtime_error {
public:
    explicit EvalError(const std::string& message) : std::runtime_error(message) {}
};

// Structurally malformed input: length mismatch, label out of range, bad option.
class ValidationError : public EvalError {
public:
    explicit ValidationError(const std::string& message) : EvalError(message) {}
};

// NaN or infinite score, coordinate, threshold or overlap value.
class NumericError : public EvalError {
public:
    explicit NumericError(const std::string& message) : EvalError(message) {}
};

// Dataset file missing or not in the expected layout.
class DatasetError : public EvalError {
public:
    explicit DatasetError(const std::string& message) : EvalError(message) {}
};

} // namespace deteval::eval
