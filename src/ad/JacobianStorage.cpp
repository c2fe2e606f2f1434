#include "fwdiff/ad/JacobianStorage.hpp"
#include "fwdiff/core/Error.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace fwdiff::ad {

namespace {
    void requireShape(const MatrixX& storage, Index rows, const char* what) {
        if (storage.rows() != rows) {
            throw ShapeMismatchError(std::string(what) + " storage has " +
                                     std::to_string(storage.rows()) + " rows, expected " +
                                     std::to_string(rows) + ".");
        }
    }

    // Visit (i, j, value) for every position inside the pattern
    template<typename Visitor>
    void forEachEntry(const MatrixX& storage, const JacobianSparsity& sparsity, Visitor visit) {
        const Index n = storage.cols();
        sparsity.validate(n);

        switch (sparsity.type()) {
            case JacobianSparsity::Type::DENSE:
                requireShape(storage, n, "Dense");
                for (Index j = 0; j < n; ++j) {
                    for (Index i = 0; i < n; ++i) {
                        visit(i, j, storage(i, j));
                    }
                }
                break;

            case JacobianSparsity::Type::BANDED: {
                const Index bandwidth = *sparsity.bandwidth();
                const Index hbw = sparsity.halfBandwidth();
                requireShape(storage, bandwidth, "Banded");
                for (Index j = 0; j < n; ++j) {
                    const Index first = std::max<Index>(0, j - hbw);
                    const Index last = std::min<Index>(n - 1, j + hbw);
                    for (Index i = first; i <= last; ++i) {
                        visit(i, j, storage(i - j + hbw, j));
                    }
                }
                break;
            }

            case JacobianSparsity::Type::BLOCK_DIAGONAL: {
                const Index blocksize = *sparsity.blocksize();
                requireShape(storage, blocksize, "Block diagonal");
                for (Index offset = 0; offset < n; offset += blocksize) {
                    for (Index k = 0; k < blocksize; ++k) {
                        for (Index i = 0; i < blocksize; ++i) {
                            visit(offset + i, offset + k, storage(i, offset + k));
                        }
                    }
                }
                break;
            }
        }
    }
}

MatrixX bandedToDense(const MatrixX& band, Index bandwidth) {
    return toDense(band, JacobianSparsity::banded(bandwidth));
}

MatrixX blockDiagonalToDense(const MatrixX& blocks, Index blocksize) {
    return toDense(blocks, JacobianSparsity::blockDiagonal(blocksize));
}

MatrixX toDense(const MatrixX& storage, const JacobianSparsity& sparsity) {
    const Index n = storage.cols();
    MatrixX dense = MatrixX::Zero(n, n);
    forEachEntry(storage, sparsity, [&dense](Index i, Index j, Real value) {
        dense(i, j) = value;
    });
    return dense;
}

SparseMatrix toSparse(const MatrixX& storage, const JacobianSparsity& sparsity) {
    const Index n = storage.cols();
    std::vector<Triplet> triplets;
    triplets.reserve(static_cast<std::size_t>(storage.size()));

    forEachEntry(storage, sparsity, [&triplets](Index i, Index j, Real value) {
        triplets.emplace_back(i, j, value);
    });

    SparseMatrix jacobian(n, n);
    jacobian.setFromTriplets(triplets.begin(), triplets.end());
    return jacobian;
}

} // namespace fwdiff::ad
