#pragma once

#include "fwdiff/core/Types.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace fwdiff::ad {

// Known structure of a square Jacobian.
//
// DENSE          : every column gets its own seed direction (seed width n).
// BANDED         : odd `bandwidth` = 2h+1, entries with |i-j| <= h only.
//                  Columns j and j + bandwidth share a seed direction.
// BLOCK_DIAGONAL : n/blocksize independent blocksize x blocksize blocks.
//                  Local column k of every block shares direction k.
//
// The structure is a promise by the caller. It is not checked against the
// function: a pattern narrower than the true one gives a wrong Jacobian.
class JacobianSparsity {
public:
    enum class Type {
        DENSE,
        BANDED,
        BLOCK_DIAGONAL
    };

    struct Shape {
        Index rows;
        Index cols;

        bool operator==(const Shape& other) const {
            return rows == other.rows && cols == other.cols;
        }
    };

    JacobianSparsity() : type_(Type::DENSE) {}

    JacobianSparsity(Type type,
                     std::optional<Index> bandwidth = std::nullopt,
                     std::optional<Index> blocksize = std::nullopt)
        : type_(type), bandwidth_(bandwidth), blocksize_(blocksize) {}

    static JacobianSparsity dense() { return JacobianSparsity(Type::DENSE); }
    static JacobianSparsity banded(Index bandwidth) {
        return JacobianSparsity(Type::BANDED, bandwidth, std::nullopt);
    }
    static JacobianSparsity blockDiagonal(Index blocksize) {
        return JacobianSparsity(Type::BLOCK_DIAGONAL, std::nullopt, blocksize);
    }

    Type type() const { return type_; }
    const std::optional<Index>& bandwidth() const { return bandwidth_; }
    const std::optional<Index>& blocksize() const { return blocksize_; }

    // Throws ConfigurationError if the descriptor is unusable for size n
    void validate(Index n) const;

    // Number of simultaneous derivative directions for problem size n
    Index seedWidth(Index n) const;

    // Seed direction of variable j (0-indexed)
    Index seedSlot(Index j, Index n) const { return j % seedWidth(n); }

    // (bandwidth - 1) / 2
    Index halfBandwidth() const;

    // Required shape of the caller's Jacobian storage
    Shape storageShape(Index n) const;

    // Same type and same governing parameter
    bool operator==(const JacobianSparsity& other) const;
    bool operator!=(const JacobianSparsity& other) const { return !(*this == other); }

    std::string describe() const;

private:
    Type type_;
    std::optional<Index> bandwidth_;
    std::optional<Index> blocksize_;
};

const char* toString(JacobianSparsity::Type type);

// Accepts "dense", "banded", "block_diagonal" (case-insensitive, '-' or '_')
JacobianSparsity::Type parseSparsityType(const std::string& name);

std::ostream& operator<<(std::ostream& os, const JacobianSparsity& sparsity);

} // namespace fwdiff::ad
