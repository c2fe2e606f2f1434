#include "fwdiff/ad/JacobianSparsity.hpp"
#include "fwdiff/core/Error.hpp"
#include "fwdiff/io/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace fwdiff::ad {

namespace {
    [[noreturn]] void reject(ErrorCode code, const std::string& message) {
        FWDIFF_LOG_DEBUG("Rejected Jacobian sparsity: {}", message);
        throw ConfigurationError(code, message);
    }

    Index requireBandwidth(const std::optional<Index>& bandwidth) {
        if (!bandwidth) {
            reject(ErrorCode::INVALID_PARAMETER,
                   "`bandwidth` must be an argument when computing a banded jacobian.");
        }
        return *bandwidth;
    }

    Index requireBlocksize(const std::optional<Index>& blocksize) {
        if (!blocksize) {
            reject(ErrorCode::INVALID_PARAMETER,
                   "`blocksize` must be an argument when computing a block diagonal jacobian.");
        }
        return *blocksize;
    }

    [[noreturn]] void rejectType() {
        reject(ErrorCode::UNKNOWN_SPARSITY,
               "Invalid value for the Jacobian sparsity type.");
    }
}

void JacobianSparsity::validate(Index n) const {
    switch (type_) {
        case Type::DENSE:
            return;

        case Type::BANDED: {
            Index bandwidth = requireBandwidth(bandwidth_);
            if (bandwidth > n) {
                reject(ErrorCode::INVALID_PARAMETER, "`bandwidth` can not be > size(x).");
            }
            if (bandwidth < 1) {
                reject(ErrorCode::INVALID_PARAMETER, "`bandwidth` can not be < 1.");
            }
            if (bandwidth % 2 == 0) {
                reject(ErrorCode::INVALID_PARAMETER, "`bandwidth` must be odd.");
            }
            return;
        }

        case Type::BLOCK_DIAGONAL: {
            Index blocksize = requireBlocksize(blocksize_);
            if (blocksize > n) {
                reject(ErrorCode::INVALID_PARAMETER, "`blocksize` can not be > size(x).");
            }
            if (blocksize < 1) {
                reject(ErrorCode::INVALID_PARAMETER, "`blocksize` can not be < 1.");
            }
            if (n % blocksize != 0) {
                reject(ErrorCode::INVALID_PARAMETER,
                       "size(x) must be an integer multiple of `blocksize`.");
            }
            return;
        }
    }
    rejectType();
}

Index JacobianSparsity::seedWidth(Index n) const {
    switch (type_) {
        case Type::DENSE:
            return n;
        case Type::BANDED:
            return requireBandwidth(bandwidth_);
        case Type::BLOCK_DIAGONAL:
            return requireBlocksize(blocksize_);
    }
    rejectType();
}

Index JacobianSparsity::halfBandwidth() const {
    return (requireBandwidth(bandwidth_) - 1) / 2;
}

JacobianSparsity::Shape JacobianSparsity::storageShape(Index n) const {
    return Shape{seedWidth(n), n};
}

bool JacobianSparsity::operator==(const JacobianSparsity& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::DENSE:
            return true;
        case Type::BANDED:
            return bandwidth_ == other.bandwidth_;
        case Type::BLOCK_DIAGONAL:
            return blocksize_ == other.blocksize_;
    }
    return true;
}

std::string JacobianSparsity::describe() const {
    std::string text = toString(type_);
    if (type_ == Type::BANDED && bandwidth_) {
        text += "(bandwidth=" + std::to_string(*bandwidth_) + ")";
    } else if (type_ == Type::BLOCK_DIAGONAL && blocksize_) {
        text += "(blocksize=" + std::to_string(*blocksize_) + ")";
    }
    return text;
}

const char* toString(JacobianSparsity::Type type) {
    switch (type) {
        case JacobianSparsity::Type::DENSE:
            return "dense";
        case JacobianSparsity::Type::BANDED:
            return "banded";
        case JacobianSparsity::Type::BLOCK_DIAGONAL:
            return "block_diagonal";
    }
    return "unknown";
}

JacobianSparsity::Type parseSparsityType(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });

    if (key == "dense") {
        return JacobianSparsity::Type::DENSE;
    } else if (key == "banded") {
        return JacobianSparsity::Type::BANDED;
    } else if (key == "block_diagonal" || key == "blockdiagonal") {
        return JacobianSparsity::Type::BLOCK_DIAGONAL;
    }
    reject(ErrorCode::UNKNOWN_SPARSITY, "Unknown Jacobian sparsity type: " + name);
}

std::ostream& operator<<(std::ostream& os, const JacobianSparsity& sparsity) {
    return os << sparsity.describe();
}

} // namespace fwdiff::ad
