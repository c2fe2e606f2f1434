#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/core/Error.hpp"
#include "fwdiff/ad/DualNumber.hpp"
#include "fwdiff/ad/JacobianSparsity.hpp"
#include "fwdiff/ad/JacobianWorkMemory.hpp"
#include "fwdiff/ad/JacobianDecompression.hpp"
#include "fwdiff/io/Logger.hpp"
#include <string>
#include <utility>
#include <vector>

namespace fwdiff::ad {

// Value and first derivative of a scalar function at a point
struct DerivativeResult {
    Real value;
    Real derivative;
};

// Forward-mode automatic differentiation.
//
// Every entry point seeds the inputs, calls the user function exactly once and
// unpacks the derivative directions. Calling shapes:
//
//   derivative : Dual fcn(const Dual& x)
//   gradient   : Dual fcn(const DualVector& x)
//   jacobian   : void fcn(const DualVector& x, DualVector& f)
//
// Usage errors throw fwdiff::Error subclasses before any output is written.
class ForwardAD {
public:
    // f(x) and df/dx for a scalar function
    template<typename Func>
    static DerivativeResult derivative(Func&& fcn, Real x) {
        Dual y = fcn(Dual(x, 1, 0));
        return DerivativeResult{y.value(), y.isConstant() ? Real(0) : y.derivative(0)};
    }

    // f(x) and the gradient of a vector-to-scalar function in one evaluation
    template<typename Func>
    static void gradient(Func&& fcn, const VectorX& x, Real& f, VectorX& grad) {
        const Index n = x.size();

        if (grad.size() != n) {
            FWDIFF_LOG_DEBUG("Gradient rejected: dfdx has size {}, x has size {}", grad.size(), n);
            throw ShapeMismatchError("Output `dfdx` array is not the right size.");
        }

        // Seed the dual number
        DualVector x_dual;
        x_dual.reserve(static_cast<std::size_t>(n));
        for (Index i = 0; i < n; ++i) {
            x_dual.emplace_back(x[i], n, i);
        }

        // Do differentiation
        Dual y = fcn(static_cast<const DualVector&>(x_dual));

        if (!y.isConstant() && y.width() != n) {
            FWDIFF_LOG_DEBUG("Gradient rejected: function returned width {}, expected {}", y.width(), n);
            throw DimensionMismatchError("Gradient function returned " + std::to_string(y.width()) +
                                         " derivative directions, expected " + std::to_string(n) + ".");
        }

        f = y.value();
        if (y.isConstant()) {
            grad.setZero();
        } else {
            grad = y.derivatives();
        }
    }

    template<typename Func>
    static VectorX gradient(Func&& fcn, const VectorX& x) {
        Real f = Real(0);
        VectorX grad(x.size());
        gradient(std::forward<Func>(fcn), x, f, grad);
        return grad;
    }

    // Derivative of a vector-to-scalar function along direction v (one seed)
    template<typename Func>
    static Real directionalDerivative(Func&& fcn, const VectorX& x, const VectorX& v) {
        const Index n = x.size();

        if (v.size() != n) {
            FWDIFF_LOG_DEBUG("Directional derivative rejected: v has size {}, x has size {}", v.size(), n);
            throw ShapeMismatchError("Direction `v` has size " + std::to_string(v.size()) +
                                     ", expected " + std::to_string(n) + ".");
        }

        DualVector x_dual;
        x_dual.reserve(static_cast<std::size_t>(n));
        for (Index i = 0; i < n; ++i) {
            Dual::DerivativeVector dir(1);
            dir[0] = v[i];
            x_dual.emplace_back(x[i], dir);
        }

        Dual y = fcn(static_cast<const DualVector&>(x_dual));
        return y.isConstant() ? Real(0) : y.derivative(0);
    }

    // Jacobian of a square vector-to-vector function, allocating work memory
    // for this call only. See decompressDense/Banded/BlockDiagonal for the
    // layout of dfdx per sparsity type.
    template<typename Func>
    static void jacobian(Func&& fcn, const VectorX& x, VectorX& f, MatrixX& dfdx,
                         const JacobianSparsity& sparsity = JacobianSparsity::dense()) {
        validateJacobianCall(x, f, dfdx, sparsity);
        JacobianWorkMemory work(x.size(), sparsity);
        evaluate(std::forward<Func>(fcn), x, f, dfdx, work);
    }

    // Jacobian reusing caller-owned work memory built for the same sparsity
    template<typename Func>
    static void jacobian(Func&& fcn, const VectorX& x, VectorX& f, MatrixX& dfdx,
                         JacobianWorkMemory& work,
                         const JacobianSparsity& sparsity = JacobianSparsity::dense()) {
        validateJacobianCall(x, f, dfdx, sparsity);
        checkWorkMemory(work, sparsity, x.size());
        evaluate(std::forward<Func>(fcn), x, f, dfdx, work);
    }

private:
    template<typename Func>
    static void evaluate(Func&& fcn, const VectorX& x, VectorX& f, MatrixX& dfdx,
                         JacobianWorkMemory& work) {
        FWDIFF_LOG_TRACE("Jacobian evaluation: n = {}, sparsity = {}, seed width = {}",
                         work.size(), work.sparsity().describe(), work.seedWidth());

        work.seed(x);
        work.resetOutputs();

        // Do differentiation
        fcn(static_cast<const DualVector&>(work.inputs()), work.outputs());

        checkEvaluatedOutputs(work);
        unpackJacobian(work, f, dfdx);
    }
};

// Automatic differentiation utilities
class ADUtils {
public:
    // Central-difference gradient of a plain vector-to-scalar function
    template<typename Func>
    static VectorX finiteDifferenceGradient(Func f, const VectorX& x, Real h = Real(1e-6)) {
        const Index n = x.size();
        VectorX grad(n);
        VectorX x_plus = x;
        VectorX x_minus = x;

        for (Index i = 0; i < n; ++i) {
            x_plus[i] = x[i] + h;
            x_minus[i] = x[i] - h;

            grad[i] = (f(x_plus) - f(x_minus)) / (2 * h);

            x_plus[i] = x[i];
            x_minus[i] = x[i];
        }

        return grad;
    }

    // Central-difference dense Jacobian of void f(const VectorX&, VectorX&)
    template<typename Func>
    static MatrixX finiteDifferenceJacobian(Func f, const VectorX& x, Real h = Real(1e-6)) {
        const Index n = x.size();
        MatrixX jac(n, n);
        VectorX x_plus = x;
        VectorX x_minus = x;
        VectorX f_plus(n);
        VectorX f_minus(n);

        for (Index j = 0; j < n; ++j) {
            x_plus[j] = x[j] + h;
            x_minus[j] = x[j] - h;

            f(x_plus, f_plus);
            f(x_minus, f_minus);
            jac.col(j) = (f_plus - f_minus) / (2 * h);

            x_plus[j] = x[j];
            x_minus[j] = x[j];
        }

        return jac;
    }

    // Largest entrywise error, relative where the entries are not tiny
    static Real maxRelativeError(const MatrixX& a, const MatrixX& b);

    static bool compare(const MatrixX& a, const MatrixX& b, Real tolerance) {
        return a.rows() == b.rows() && a.cols() == b.cols() &&
               maxRelativeError(a, b) < tolerance;
    }
};

} // namespace fwdiff::ad
