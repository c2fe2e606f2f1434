#include "fwdiff/ad/JacobianWorkMemory.hpp"
#include "fwdiff/core/Error.hpp"
#include "fwdiff/io/Logger.hpp"

namespace fwdiff::ad {

JacobianWorkMemory::JacobianWorkMemory(Index n, const JacobianSparsity& sparsity)
    : n_(n), sparsity_(sparsity), seedWidth_(0) {

    if (n_ < 0) {
        FWDIFF_LOG_DEBUG("Work memory rejected: negative size {}", n_);
        throw ConfigurationError("Work memory size can not be negative: " + std::to_string(n_));
    }

    sparsity_.validate(n_);
    seedWidth_ = sparsity_.seedWidth(n_);

    inputs_.assign(static_cast<std::size_t>(n_), Dual(Real(0), seedWidth_, -1));
    outputs_.assign(static_cast<std::size_t>(n_), Dual(Real(0), seedWidth_, -1));

    FWDIFF_LOG_TRACE("Allocated Jacobian work memory: n = {}, sparsity = {}, seed width = {}",
                     n_, sparsity_.describe(), seedWidth_);
}

void JacobianWorkMemory::seed(const VectorX& x) {
    if (x.size() != n_) {
        FWDIFF_LOG_DEBUG("Seeding rejected: x has size {}, work memory size {}", x.size(), n_);
        throw ShapeMismatchError("Input `x` has size " + std::to_string(x.size()) +
                                 " but the work memory was built for " + std::to_string(n_) + ".");
    }

    // Cyclic partition: variable j owns direction j mod seedWidth
    for (Index j = 0; j < n_; ++j) {
        Dual& xj = inputs_[static_cast<std::size_t>(j)];
        if (xj.width() != seedWidth_) {
            xj.resize(seedWidth_);
        }
        xj.seed(x[j], j % seedWidth_);
    }
}

void JacobianWorkMemory::resetOutputs() {
    outputs_.resize(static_cast<std::size_t>(n_));
    for (auto& fi : outputs_) {
        fi.value() = Real(0);
        if (fi.width() != seedWidth_) {
            fi.resize(seedWidth_);
        } else {
            fi.derivatives().setZero();
        }
    }
}

} // namespace fwdiff::ad
