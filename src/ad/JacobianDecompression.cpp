#include "fwdiff/ad/JacobianDecompression.hpp"
#include "fwdiff/core/Error.hpp"
#include "fwdiff/io/Logger.hpp"
#include <string>

namespace fwdiff::ad {

namespace {
    std::string shapeString(Index rows, Index cols) {
        return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
    }

    // Derivative of a single output along direction k; constants contribute 0
    Real directional(const Dual& fi, Index k) {
        return fi.isConstant() ? Real(0) : fi.derivative(k);
    }
}

void validateJacobianCall(const VectorX& x, const VectorX& f, const MatrixX& dfdx,
                          const JacobianSparsity& sparsity) {
    const Index n = x.size();

    if (f.size() != n) {
        FWDIFF_LOG_DEBUG("Jacobian rejected: f has size {}, x has size {}", f.size(), n);
        throw ShapeMismatchError("Output `f` array is not the right size.");
    }

    sparsity.validate(n);

    const JacobianSparsity::Shape expected = sparsity.storageShape(n);
    if (dfdx.rows() != expected.rows || dfdx.cols() != expected.cols) {
        FWDIFF_LOG_DEBUG("Jacobian rejected: dfdx is {}, {} storage needs {}",
                         shapeString(dfdx.rows(), dfdx.cols()), sparsity.describe(),
                         shapeString(expected.rows, expected.cols));
        throw ShapeMismatchError("Output `dfdx` array is not the right size: expected " +
                                 shapeString(expected.rows, expected.cols) + ", got " +
                                 shapeString(dfdx.rows(), dfdx.cols()) + ".");
    }
}

void checkWorkMemory(const JacobianWorkMemory& work, const JacobianSparsity& sparsity, Index n) {
    if (work.sparsity().type() != sparsity.type()) {
        FWDIFF_LOG_DEBUG("Jacobian rejected: work memory is {}, call requested {}",
                         work.sparsity().describe(), sparsity.describe());
        throw WorkMemoryMismatchError(
            "The work memory has a Jacobian type (" + std::string(toString(work.sparsity().type())) +
            ") inconsistent with the requested type (" + toString(sparsity.type()) + ").");
    }
    if (!work.matches(sparsity, n)) {
        FWDIFF_LOG_DEBUG("Jacobian rejected: work memory {} of size {}, call requested {} of size {}",
                         work.sparsity().describe(), work.size(), sparsity.describe(), n);
        throw WorkMemoryMismatchError(
            "The work memory was built for " + work.sparsity().describe() + " with n = " +
            std::to_string(work.size()) + ", but the call requested " + sparsity.describe() +
            " with n = " + std::to_string(n) + ".");
    }
}

void checkEvaluatedOutputs(const JacobianWorkMemory& work) {
    const DualVector& outputs = work.outputs();

    if (static_cast<Index>(outputs.size()) != work.size()) {
        FWDIFF_LOG_DEBUG("Jacobian rejected: function produced {} outputs, expected {}",
                         outputs.size(), work.size());
        throw ShapeMismatchError("Function produced " + std::to_string(outputs.size()) +
                                 " outputs, expected " + std::to_string(work.size()) + ".");
    }

    for (std::size_t i = 0; i < outputs.size(); ++i) {
        const Dual& fi = outputs[i];
        if (!fi.isConstant() && fi.width() != work.seedWidth()) {
            FWDIFF_LOG_DEBUG("Jacobian rejected: output {} has width {}, seed width {}",
                             i, fi.width(), work.seedWidth());
            throw DimensionMismatchError("Output " + std::to_string(i) + " carries " +
                                         std::to_string(fi.width()) + " derivative directions, expected " +
                                         std::to_string(work.seedWidth()) + ".");
        }
    }
}

void decompressDense(const DualVector& outputs, MatrixX& dfdx) {
    const Index n = static_cast<Index>(outputs.size());

    // | df(1,1) df(1,2) df(1,3) |
    // | df(2,1) df(2,2) df(2,3) |
    // | df(3,1) df(3,2) df(3,3) |
    for (Index j = 0; j < n; ++j) {
        for (Index i = 0; i < n; ++i) {
            dfdx(i, j) = directional(outputs[static_cast<std::size_t>(i)], j);
        }
    }
}

void decompressBanded(const DualVector& outputs, Index bandwidth, MatrixX& dfdx) {
    const Index n = static_cast<Index>(outputs.size());
    const Index hbw = (bandwidth - 1) / 2;

    // Diagonals of the Jacobian become rows of dfdx; row 0 is the highest one.
    //
    // | df(1,1) df(1,2) 0       0       0       |
    // | df(2,1) df(2,2) df(2,3) 0       0       |  ->  | 0       df(1,2) df(2,3) df(3,4) df(4,5) |
    // | 0       df(3,2) df(3,3) df(3,4) 0       |  ->  | df(1,1) df(2,2) df(3,3) df(4,4) df(5,5) |
    // | 0       0       df(4,3) df(4,4) df(4,5) |  ->  | df(2,1) df(3,2) df(4,3) df(5,4) 0       |
    // | 0       0       0       df(5,4) df(5,5) |
    //
    // Columns sharing a direction are `bandwidth` apart, so their nonzero rows
    // never overlap.
    for (Index j = 0; j < n; ++j) {
        const Index k = j % bandwidth;
        for (Index d = -hbw; d <= hbw; ++d) {
            const Index i = j + d;
            if (i < 0 || i >= n) {
                dfdx(d + hbw, j) = Real(0);
            } else {
                dfdx(d + hbw, j) = directional(outputs[static_cast<std::size_t>(i)], k);
            }
        }
    }
}

void decompressBlockDiagonal(const DualVector& outputs, Index blocksize, MatrixX& dfdx) {
    const Index n = static_cast<Index>(outputs.size());

    // | df(1,1) df(1,2) 0       0       |
    // | df(2,1) df(2,2) 0       0       |  ->  | df(1,1) df(1,2) df(3,3) df(3,4) |
    // | 0       0       df(3,3) df(3,4) |  ->  | df(2,1) df(2,2) df(4,3) df(4,4) |
    // | 0       0       df(4,3) df(4,4) |
    for (Index offset = 0; offset < n; offset += blocksize) {
        for (Index k = 0; k < blocksize; ++k) {
            for (Index i = 0; i < blocksize; ++i) {
                dfdx(i, offset + k) = directional(outputs[static_cast<std::size_t>(offset + i)], k);
            }
        }
    }
}

void unpackJacobian(const JacobianWorkMemory& work, VectorX& f, MatrixX& dfdx) {
    const DualVector& outputs = work.outputs();
    const JacobianSparsity& sparsity = work.sparsity();

    switch (sparsity.type()) {
        case JacobianSparsity::Type::DENSE:
            decompressDense(outputs, dfdx);
            break;
        case JacobianSparsity::Type::BANDED:
            decompressBanded(outputs, *sparsity.bandwidth(), dfdx);
            break;
        case JacobianSparsity::Type::BLOCK_DIAGONAL:
            decompressBlockDiagonal(outputs, *sparsity.blocksize(), dfdx);
            break;
    }

    // Unpack f(x)
    for (Index i = 0; i < work.size(); ++i) {
        f[i] = outputs[static_cast<std::size_t>(i)].value();
    }
}

} // namespace fwdiff::ad
