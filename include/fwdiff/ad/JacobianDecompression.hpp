#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/ad/JacobianSparsity.hpp"
#include "fwdiff/ad/JacobianWorkMemory.hpp"

namespace fwdiff::ad {

// Checks shared by every Jacobian variant. All of them throw before anything
// is written to the caller's arrays.

// f.size() == x.size(), descriptor valid for x.size(), dfdx shaped for it
void validateJacobianCall(const VectorX& x, const VectorX& f, const MatrixX& dfdx,
                          const JacobianSparsity& sparsity);

// Throws WorkMemoryMismatchError unless `work` was built for (sparsity, n)
void checkWorkMemory(const JacobianWorkMemory& work, const JacobianSparsity& sparsity, Index n);

// After evaluation: n outputs, each of the seed width (or a constant)
void checkEvaluatedOutputs(const JacobianWorkMemory& work);

// Unpack compressed output derivatives into the caller's storage layout.
//
// Dense          : dfdx(i, j)          = df_i/dx_j
// Banded         : dfdx(i - j + h, j)  = df_i/dx_j for |i - j| <= h, 0 outside the matrix
// Block diagonal : dfdx(i, b*bs + k)   = df_{b*bs+i}/dx_{b*bs+k}
void decompressDense(const DualVector& outputs, MatrixX& dfdx);
void decompressBanded(const DualVector& outputs, Index bandwidth, MatrixX& dfdx);
void decompressBlockDiagonal(const DualVector& outputs, Index blocksize, MatrixX& dfdx);

// Dispatch on the work memory's sparsity and unpack f(x) from the output values
void unpackJacobian(const JacobianWorkMemory& work, VectorX& f, MatrixX& dfdx);

} // namespace fwdiff::ad
