#pragma once

#include <stdexcept>
#include <string>

namespace fwdiff {

// Error categories reported by the differentiation entry points
enum class ErrorCode {
    SHAPE_MISMATCH,
    INVALID_PARAMETER,
    UNKNOWN_SPARSITY,
    WORK_MEMORY_MISMATCH,
    DIMENSION_MISMATCH,
    CONFIG_FILE
};

const char* toString(ErrorCode code);

// Base class for all usage errors. Every error is raised before any
// caller-visible output has been written.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Output array size disagrees with the input size or the sparsity descriptor
class ShapeMismatchError : public Error {
public:
    explicit ShapeMismatchError(const std::string& message)
        : Error(ErrorCode::SHAPE_MISMATCH, message) {}
};

// Invalid or missing sparsity parameter, unknown sparsity type, bad config file
class ConfigurationError : public Error {
public:
    ConfigurationError(ErrorCode code, const std::string& message)
        : Error(code, message) {}

    explicit ConfigurationError(const std::string& message)
        : Error(ErrorCode::INVALID_PARAMETER, message) {}
};

// A supplied work memory was built for a different Jacobian layout
class WorkMemoryMismatchError : public Error {
public:
    explicit WorkMemoryMismatchError(const std::string& message)
        : Error(ErrorCode::WORK_MEMORY_MISMATCH, message) {}
};

// Arithmetic between dual numbers carrying different numbers of directions
class DimensionMismatchError : public Error {
public:
    explicit DimensionMismatchError(const std::string& message)
        : Error(ErrorCode::DIMENSION_MISMATCH, message) {}
};

} // namespace fwdiff
