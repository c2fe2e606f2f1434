// tests/unit/test_derivative.cpp
#include <gtest/gtest.h>
#include "fwdiff/ad/AutoDiff.hpp"
#include <cmath>

using namespace fwdiff;
using namespace fwdiff::ad;

TEST(DerivativeTest, Square) {
    auto result = ForwardAD::derivative([](const Dual& x) { return x * x; }, 3.0);

    EXPECT_DOUBLE_EQ(result.value, 9.0);
    EXPECT_DOUBLE_EQ(result.derivative, 6.0);
}

TEST(DerivativeTest, Composition) {
    // f(x) = exp(sin(x)) / x
    auto fcn = [](const Dual& x) { return exp(sin(x)) / x; };
    const double x0 = 1.2;

    auto result = ForwardAD::derivative(fcn, x0);

    double expected = std::exp(std::sin(x0)) * (std::cos(x0) * x0 - 1.0) / (x0 * x0);
    EXPECT_NEAR(result.value, std::exp(std::sin(x0)) / x0, 1e-14);
    EXPECT_NEAR(result.derivative, expected, 1e-13);
}

TEST(DerivativeTest, ConstantFunction) {
    auto result = ForwardAD::derivative([](const Dual&) { return Dual(4.0); }, 1.0);

    EXPECT_DOUBLE_EQ(result.value, 4.0);
    EXPECT_DOUBLE_EQ(result.derivative, 0.0);
}

class GradientTest : public ::testing::Test {
protected:
    void SetUp() override {
        x.resize(3);
        x << 1.0, 2.0, 3.0;
    }

    // f(x) = x0² x1 + sin(x2)
    static Dual rosenLike(const DualVector& v) {
        return v[0] * v[0] * v[1] + sin(v[2]);
    }

    VectorX x;
};

TEST_F(GradientTest, SingleEvaluation) {
    int calls = 0;
    auto fcn = [&calls](const DualVector& v) {
        ++calls;
        return rosenLike(v);
    };

    Real f = 0.0;
    VectorX grad(3);
    ForwardAD::gradient(fcn, x, f, grad);

    EXPECT_EQ(calls, 1);
    EXPECT_NEAR(f, 2.0 + std::sin(3.0), 1e-15);
    EXPECT_DOUBLE_EQ(grad[0], 4.0);
    EXPECT_DOUBLE_EQ(grad[1], 1.0);
    EXPECT_NEAR(grad[2], std::cos(3.0), 1e-15);
}

TEST_F(GradientTest, ReturningOverload) {
    VectorX grad = ForwardAD::gradient(rosenLike, x);
    ASSERT_EQ(grad.size(), 3);
    EXPECT_DOUBLE_EQ(grad[0], 4.0);
}

TEST_F(GradientTest, MatchesFiniteDifferences) {
    auto plain = [](const VectorX& v) {
        return v[0] * v[0] * v[1] + std::sin(v[2]);
    };

    VectorX ad = ForwardAD::gradient(rosenLike, x);
    VectorX fd = ADUtils::finiteDifferenceGradient(plain, x);

    EXPECT_TRUE(ADUtils::compare(ad, fd, 1e-6));
}

TEST_F(GradientTest, OutputSizeMismatch) {
    Real f = -1.0;
    VectorX grad = VectorX::Constant(2, -1.0);

    try {
        ForwardAD::gradient(rosenLike, x, f, grad);
        FAIL() << "expected ShapeMismatchError";
    } catch (const ShapeMismatchError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::SHAPE_MISMATCH);
    }

    // Nothing written
    EXPECT_DOUBLE_EQ(f, -1.0);
    EXPECT_DOUBLE_EQ(grad[0], -1.0);
}

TEST_F(GradientTest, ConstantFunction) {
    Real f = 0.0;
    VectorX grad = VectorX::Ones(3);
    ForwardAD::gradient([](const DualVector&) { return Dual(2.5); }, x, f, grad);

    EXPECT_DOUBLE_EQ(f, 2.5);
    EXPECT_DOUBLE_EQ(grad.cwiseAbs().sum(), 0.0);
}

TEST_F(GradientTest, DirectionalDerivative) {
    VectorX v(3);
    v << 1.0, -1.0, 0.5;

    Real dd = ForwardAD::directionalDerivative(rosenLike, x, v);
    VectorX grad = ForwardAD::gradient(rosenLike, x);

    EXPECT_NEAR(dd, grad.dot(v), 1e-14);
    EXPECT_THROW(ForwardAD::directionalDerivative(rosenLike, x, VectorX::Ones(2)),
                 ShapeMismatchError);
}
