#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/ad/JacobianSparsity.hpp"

namespace fwdiff::ad {

// Expand compressed Jacobian storage back to full n x n form

// band is bandwidth x n, J(i, j) = band(i - j + h, j)
MatrixX bandedToDense(const MatrixX& band, Index bandwidth);

// blocks is blocksize x n, J(b*bs + i, b*bs + k) = blocks(i, b*bs + k)
MatrixX blockDiagonalToDense(const MatrixX& blocks, Index blocksize);

// Dispatch on sparsity; dense storage is returned as is
MatrixX toDense(const MatrixX& storage, const JacobianSparsity& sparsity);

// Sparse matrix holding every structurally nonzero position of the pattern,
// including stored zeros inside the band or blocks
SparseMatrix toSparse(const MatrixX& storage, const JacobianSparsity& sparsity);

} // namespace fwdiff::ad
