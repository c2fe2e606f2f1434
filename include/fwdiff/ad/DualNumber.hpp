#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/core/Error.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace fwdiff::ad {

// Forward-mode automatic differentiation using dual numbers.
//
// A dual carries a value and its directional derivatives along `width()`
// independent seed directions. With N = Dynamic the width is fixed when the
// dual is constructed and never grows through arithmetic. A dual with an empty
// derivative vector is a constant: combined with an active dual, its
// derivatives count as zero. Two active duals of different widths cannot be
// combined (DimensionMismatchError).
template<typename T, int N = Dynamic>
class DualNumber {
public:
    using value_type = T;
    using DerivativeVector = Eigen::Matrix<T, N, 1>;
    static constexpr int num_derivatives = N;

    // Constructors
    DualNumber() : value_(T(0)), derivatives_(DerivativeVector::Zero(N == Dynamic ? 0 : N)) {}

    explicit DualNumber(const T& value)
        : value_(value), derivatives_(DerivativeVector::Zero(N == Dynamic ? 0 : N)) {}

    // Independent variable: `width` directions, slot `index` seeded with 1
    DualNumber(const T& value, Index width, Index index)
        : value_(value), derivatives_(DerivativeVector::Zero(width)) {
        if (index >= 0 && index < width) {
            derivatives_[index] = T(1);
        }
    }

    DualNumber(const T& value, const DerivativeVector& derivatives)
        : value_(value), derivatives_(derivatives) {}

    // Copy and assignment
    DualNumber(const DualNumber&) = default;
    DualNumber(DualNumber&&) = default;
    DualNumber& operator=(const DualNumber&) = default;
    DualNumber& operator=(DualNumber&&) = default;

    // Value and derivative access
    const T& value() const { return value_; }
    T& value() { return value_; }

    const T& derivative(Index i = 0) const { return derivatives_[i]; }
    T& derivative(Index i = 0) { return derivatives_[i]; }

    const DerivativeVector& derivatives() const { return derivatives_; }
    DerivativeVector& derivatives() { return derivatives_; }

    Index width() const { return derivatives_.size(); }
    bool isConstant() const { return derivatives_.size() == 0; }

    // Reallocate to `width` zeroed directions
    void resize(Index width) {
        derivatives_ = DerivativeVector::Zero(width);
    }

    // Set the value, clear all directions and mark `slot` with 1
    void seed(const T& value, Index slot) {
        value_ = value;
        derivatives_.setZero();
        if (slot >= 0 && slot < derivatives_.size()) {
            derivatives_[slot] = T(1);
        }
    }

    // Conversion to value type
    explicit operator T() const { return value_; }

    // Arithmetic operators
    DualNumber operator+() const { return *this; }

    DualNumber operator-() const {
        return DualNumber(-value_, DerivativeVector(-derivatives_));
    }

    DualNumber& operator+=(const DualNumber& rhs) {
        combine(T(1), rhs, T(1));
        value_ += rhs.value_;
        return *this;
    }

    DualNumber& operator-=(const DualNumber& rhs) {
        combine(T(1), rhs, T(-1));
        value_ -= rhs.value_;
        return *this;
    }

    DualNumber& operator*=(const DualNumber& rhs) {
        // Product rule: (fg)' = f'g + fg'
        combine(rhs.value_, rhs, value_);
        value_ *= rhs.value_;
        return *this;
    }

    DualNumber& operator/=(const DualNumber& rhs) {
        // Quotient rule: (f/g)' = (f'g - fg')/g²
        T inv_g = T(1) / rhs.value_;
        combine(inv_g, rhs, -value_ * inv_g * inv_g);
        value_ *= inv_g;
        return *this;
    }

    // Scalar operations
    DualNumber& operator+=(const T& scalar) {
        value_ += scalar;
        return *this;
    }

    DualNumber& operator-=(const T& scalar) {
        value_ -= scalar;
        return *this;
    }

    DualNumber& operator*=(const T& scalar) {
        value_ *= scalar;
        derivatives_ *= scalar;
        return *this;
    }

    DualNumber& operator/=(const T& scalar) {
        T inv = T(1) / scalar;
        value_ *= inv;
        derivatives_ *= inv;
        return *this;
    }

    // Apply the chain rule for an elementary function: value f(x), slope f'(x)
    DualNumber chain(const T& fvalue, const T& slope) const {
        return DualNumber(fvalue, DerivativeVector(derivatives_ * slope));
    }

private:
    T value_;
    DerivativeVector derivatives_;

    // derivatives_ = a * derivatives_ + b * rhs.derivatives_
    void combine(T a, const DualNumber& rhs, T b) {
        if (rhs.isConstant()) {
            derivatives_ *= a;
            return;
        }
        if (isConstant()) {
            derivatives_ = b * rhs.derivatives_;
            return;
        }
        if (derivatives_.size() != rhs.derivatives_.size()) {
            throw DimensionMismatchError(
                "Dual number width mismatch: " + std::to_string(derivatives_.size()) +
                " vs " + std::to_string(rhs.derivatives_.size()));
        }
        derivatives_ = a * derivatives_ + b * rhs.derivatives_;
    }
};

// Binary operators
template<typename T, int N>
DualNumber<T, N> operator+(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    DualNumber<T, N> result = lhs;
    result += rhs;
    return result;
}

template<typename T, int N>
DualNumber<T, N> operator-(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    DualNumber<T, N> result = lhs;
    result -= rhs;
    return result;
}

template<typename T, int N>
DualNumber<T, N> operator*(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    DualNumber<T, N> result = lhs;
    result *= rhs;
    return result;
}

template<typename T, int N>
DualNumber<T, N> operator/(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    DualNumber<T, N> result = lhs;
    result /= rhs;
    return result;
}

// Scalar operations. The scalar parameter is a non-deduced context so that
// integer literals promote to T.
template<typename T, int N>
DualNumber<T, N> operator+(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return DualNumber<T, N>(lhs.value() + rhs, lhs.derivatives());
}

template<typename T, int N>
DualNumber<T, N> operator+(const typename DualNumber<T, N>::value_type& lhs, const DualNumber<T, N>& rhs) {
    return DualNumber<T, N>(lhs + rhs.value(), rhs.derivatives());
}

template<typename T, int N>
DualNumber<T, N> operator-(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return DualNumber<T, N>(lhs.value() - rhs, lhs.derivatives());
}

template<typename T, int N>
DualNumber<T, N> operator-(const typename DualNumber<T, N>::value_type& lhs, const DualNumber<T, N>& rhs) {
    return rhs.chain(lhs - rhs.value(), T(-1));
}

template<typename T, int N>
DualNumber<T, N> operator*(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    DualNumber<T, N> result = lhs;
    result *= rhs;
    return result;
}

template<typename T, int N>
DualNumber<T, N> operator*(const typename DualNumber<T, N>::value_type& lhs, const DualNumber<T, N>& rhs) {
    DualNumber<T, N> result = rhs;
    result *= lhs;
    return result;
}

template<typename T, int N>
DualNumber<T, N> operator/(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    DualNumber<T, N> result = lhs;
    result /= rhs;
    return result;
}

template<typename T, int N>
DualNumber<T, N> operator/(const typename DualNumber<T, N>::value_type& lhs, const DualNumber<T, N>& rhs) {
    T inv_val = T(1) / rhs.value();
    return rhs.chain(lhs * inv_val, -lhs * inv_val * inv_val);
}

// Comparison operators (values only)
template<typename T, int N>
bool operator==(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    return lhs.value() == rhs.value();
}

template<typename T, int N>
bool operator!=(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    return lhs.value() != rhs.value();
}

template<typename T, int N>
bool operator<(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    return lhs.value() < rhs.value();
}

template<typename T, int N>
bool operator<=(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    return lhs.value() <= rhs.value();
}

template<typename T, int N>
bool operator>(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    return lhs.value() > rhs.value();
}

template<typename T, int N>
bool operator>=(const DualNumber<T, N>& lhs, const DualNumber<T, N>& rhs) {
    return lhs.value() >= rhs.value();
}

template<typename T, int N>
bool operator==(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return lhs.value() == rhs;
}

template<typename T, int N>
bool operator!=(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return lhs.value() != rhs;
}

template<typename T, int N>
bool operator<(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return lhs.value() < rhs;
}

template<typename T, int N>
bool operator<=(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return lhs.value() <= rhs;
}

template<typename T, int N>
bool operator>(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return lhs.value() > rhs;
}

template<typename T, int N>
bool operator>=(const DualNumber<T, N>& lhs, const typename DualNumber<T, N>::value_type& rhs) {
    return lhs.value() >= rhs;
}

// Mathematical functions
template<typename T, int N>
DualNumber<T, N> sqrt(const DualNumber<T, N>& x) {
    T sqrt_val = std::sqrt(x.value());
    return x.chain(sqrt_val, T(0.5) / sqrt_val);
}

template<typename T, int N>
DualNumber<T, N> exp(const DualNumber<T, N>& x) {
    T exp_val = std::exp(x.value());
    return x.chain(exp_val, exp_val);
}

template<typename T, int N>
DualNumber<T, N> log(const DualNumber<T, N>& x) {
    return x.chain(std::log(x.value()), T(1) / x.value());
}

template<typename T, int N>
DualNumber<T, N> log10(const DualNumber<T, N>& x) {
    return x.chain(std::log10(x.value()), T(1) / (x.value() * std::log(T(10))));
}

template<typename T, int N>
DualNumber<T, N> sin(const DualNumber<T, N>& x) {
    return x.chain(std::sin(x.value()), std::cos(x.value()));
}

template<typename T, int N>
DualNumber<T, N> cos(const DualNumber<T, N>& x) {
    return x.chain(std::cos(x.value()), -std::sin(x.value()));
}

template<typename T, int N>
DualNumber<T, N> tan(const DualNumber<T, N>& x) {
    T tan_val = std::tan(x.value());
    return x.chain(tan_val, T(1) + tan_val * tan_val);
}

template<typename T, int N>
DualNumber<T, N> asin(const DualNumber<T, N>& x) {
    return x.chain(std::asin(x.value()), T(1) / std::sqrt(T(1) - x.value() * x.value()));
}

template<typename T, int N>
DualNumber<T, N> acos(const DualNumber<T, N>& x) {
    return x.chain(std::acos(x.value()), T(-1) / std::sqrt(T(1) - x.value() * x.value()));
}

template<typename T, int N>
DualNumber<T, N> atan(const DualNumber<T, N>& x) {
    return x.chain(std::atan(x.value()), T(1) / (T(1) + x.value() * x.value()));
}

// d atan2(y, x) = (x dy - y dx) / (x² + y²)
template<typename T, int N>
DualNumber<T, N> atan2(const DualNumber<T, N>& y, const DualNumber<T, N>& x) {
    T inv_r2 = T(1) / (x.value() * x.value() + y.value() * y.value());
    DualNumber<T, N> result = y.chain(std::atan2(y.value(), x.value()), x.value() * inv_r2);
    result -= x.chain(T(0), y.value() * inv_r2);
    return result;
}

template<typename T, int N>
DualNumber<T, N> sinh(const DualNumber<T, N>& x) {
    return x.chain(std::sinh(x.value()), std::cosh(x.value()));
}

template<typename T, int N>
DualNumber<T, N> cosh(const DualNumber<T, N>& x) {
    return x.chain(std::cosh(x.value()), std::sinh(x.value()));
}

template<typename T, int N>
DualNumber<T, N> tanh(const DualNumber<T, N>& x) {
    T tanh_val = std::tanh(x.value());
    return x.chain(tanh_val, T(1) - tanh_val * tanh_val);
}

template<typename T, int N>
DualNumber<T, N> pow(const DualNumber<T, N>& x, const typename DualNumber<T, N>::value_type& p) {
    if (p == T(0)) {
        return x.chain(T(1), T(0));
    }
    T pow_val = std::pow(x.value(), p);
    T dpow_val = p * std::pow(x.value(), p - T(1));
    return x.chain(pow_val, dpow_val);
}

template<typename T, int N>
DualNumber<T, N> pow(const DualNumber<T, N>& x, int p) {
    if (p == 0) {
        return x.chain(T(1), T(0));
    }
    T pow_val = std::pow(x.value(), p);
    T dpow_val = T(p) * std::pow(x.value(), p - 1);
    return x.chain(pow_val, dpow_val);
}

template<typename T, int N>
DualNumber<T, N> pow(const typename DualNumber<T, N>::value_type& a, const DualNumber<T, N>& x) {
    T pow_val = std::pow(a, x.value());
    return x.chain(pow_val, pow_val * std::log(a));
}

template<typename T, int N>
DualNumber<T, N> pow(const DualNumber<T, N>& x, const DualNumber<T, N>& y) {
    if (y.isConstant()) {
        return pow(x, y.value());
    }
    // x^y = exp(y * log(x)), defined for x > 0 only
    return exp(y * log(x));
}

template<typename T, int N>
DualNumber<T, N> abs(const DualNumber<T, N>& x) {
    if (x.value() >= T(0)) {
        return x;
    } else {
        return -x;
    }
}

template<typename T, int N>
DualNumber<T, N> hypot(const DualNumber<T, N>& x, const DualNumber<T, N>& y) {
    T h = std::hypot(x.value(), y.value());
    if (h == T(0)) {
        return x.chain(T(0), T(0));
    }
    DualNumber<T, N> result = x.chain(h, x.value() / h);
    result += y.chain(T(0), y.value() / h);
    return result;
}

template<typename T, int N>
DualNumber<T, N> min(const DualNumber<T, N>& a, const DualNumber<T, N>& b) {
    return (a < b) ? a : b;
}

template<typename T, int N>
DualNumber<T, N> max(const DualNumber<T, N>& a, const DualNumber<T, N>& b) {
    return (a > b) ? a : b;
}

// Reductions
template<typename T, int N>
DualNumber<T, N> sum(const std::vector<DualNumber<T, N>>& x) {
    DualNumber<T, N> result;
    for (const auto& xi : x) {
        result += xi;
    }
    return result;
}

template<typename T, int N>
DualNumber<T, N> maxval(const std::vector<DualNumber<T, N>>& x) {
    if (x.empty()) {
        throw DimensionMismatchError("maxval of an empty dual vector");
    }
    DualNumber<T, N> result = x.front();
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (x[i] > result) {
            result = x[i];
        }
    }
    return result;
}

template<typename T, int N>
DualNumber<T, N> minval(const std::vector<DualNumber<T, N>>& x) {
    if (x.empty()) {
        throw DimensionMismatchError("minval of an empty dual vector");
    }
    DualNumber<T, N> result = x.front();
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (x[i] < result) {
            result = x[i];
        }
    }
    return result;
}

// Output stream
template<typename T, int N>
std::ostream& operator<<(std::ostream& os, const DualNumber<T, N>& x) {
    os << "DualNumber(" << x.value() << "; [";
    for (Index i = 0; i < x.width(); ++i) {
        if (i > 0) os << ", ";
        os << x.derivative(i);
    }
    os << "])";
    return os;
}

// Type aliases
using Dual = DualNumber<Real, Dynamic>;
using DualVector = std::vector<Dual>;

} // namespace fwdiff::ad
