#include "fwdiff/ad/AutoDiff.hpp"
#include <algorithm>
#include <cmath>

namespace fwdiff::ad {

Real ADUtils::maxRelativeError(const MatrixX& a, const MatrixX& b) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw ShapeMismatchError("Cannot compare matrices of different shapes.");
    }

    Real maxError = 0.0;
    for (Index j = 0; j < a.cols(); ++j) {
        for (Index i = 0; i < a.rows(); ++i) {
            Real error = std::abs(a(i, j) - b(i, j));
            Real scale = std::max(std::abs(a(i, j)), std::abs(b(i, j)));
            if (scale > Real(1)) {
                error /= scale;
            }
            maxError = std::max(maxError, error);
        }
    }

    return maxError;
}

} // namespace fwdiff::ad
