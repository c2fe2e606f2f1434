#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/ad/DualNumber.hpp"
#include "fwdiff/ad/JacobianSparsity.hpp"

namespace fwdiff::ad {

// Reusable dual-number storage for repeated Jacobian evaluations.
//
// Holds n input and n output duals, each preallocated with the seed width of
// the sparsity pattern. Size, pattern and seed width are fixed for the
// lifetime of the object. One evaluation borrows it exclusively; afterwards
// the contents are stale but the allocation is ready for the next point.
// Parallel callers need one work memory each.
class JacobianWorkMemory {
public:
    // Throws ConfigurationError if `sparsity` is invalid for size n
    JacobianWorkMemory(Index n, const JacobianSparsity& sparsity = JacobianSparsity::dense());

    JacobianWorkMemory(const JacobianWorkMemory&) = default;
    JacobianWorkMemory(JacobianWorkMemory&&) = default;
    JacobianWorkMemory& operator=(const JacobianWorkMemory&) = default;
    JacobianWorkMemory& operator=(JacobianWorkMemory&&) = default;

    Index size() const { return n_; }
    Index seedWidth() const { return seedWidth_; }
    const JacobianSparsity& sparsity() const { return sparsity_; }

    // True if this memory was built for `sparsity` at size n
    bool matches(const JacobianSparsity& sparsity, Index n) const {
        return sparsity_ == sparsity && n_ == n;
    }

    // Load x into the inputs and seed variable j in direction j mod seedWidth.
    // Throws ShapeMismatchError if x.size() != size().
    void seed(const VectorX& x);

    // Restore every output to a zeroed dual of the seed width
    void resetOutputs();

    DualVector& inputs() { return inputs_; }
    const DualVector& inputs() const { return inputs_; }

    DualVector& outputs() { return outputs_; }
    const DualVector& outputs() const { return outputs_; }

private:
    Index n_;
    JacobianSparsity sparsity_;
    Index seedWidth_;
    DualVector inputs_;
    DualVector outputs_;
};

} // namespace fwdiff::ad
