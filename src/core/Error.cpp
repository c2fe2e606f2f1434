#include "fwdiff/core/Error.hpp"

namespace fwdiff {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SHAPE_MISMATCH:
            return "shape mismatch";
        case ErrorCode::INVALID_PARAMETER:
            return "invalid parameter";
        case ErrorCode::UNKNOWN_SPARSITY:
            return "unknown sparsity";
        case ErrorCode::WORK_MEMORY_MISMATCH:
            return "work memory mismatch";
        case ErrorCode::DIMENSION_MISMATCH:
            return "dimension mismatch";
        case ErrorCode::CONFIG_FILE:
            return "configuration file";
    }
    return "unknown error";
}

} // namespace fwdiff
