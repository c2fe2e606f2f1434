// tests/unit/test_work_memory.cpp
#include <gtest/gtest.h>
#include "fwdiff/ad/JacobianWorkMemory.hpp"
#include "fwdiff/core/Error.hpp"

using namespace fwdiff;
using namespace fwdiff::ad;

TEST(WorkMemoryTest, DenseAllocation) {
    JacobianWorkMemory work(4);

    EXPECT_EQ(work.size(), 4);
    EXPECT_EQ(work.seedWidth(), 4);
    EXPECT_EQ(work.sparsity(), JacobianSparsity::dense());
    ASSERT_EQ(work.inputs().size(), 4u);
    ASSERT_EQ(work.outputs().size(), 4u);

    for (const auto& xi : work.inputs()) {
        EXPECT_EQ(xi.width(), 4);
    }
    for (const auto& fi : work.outputs()) {
        EXPECT_EQ(fi.width(), 4);
    }
}

TEST(WorkMemoryTest, BandedAndBlockAllocation) {
    JacobianWorkMemory banded(7, JacobianSparsity::banded(3));
    EXPECT_EQ(banded.seedWidth(), 3);
    EXPECT_EQ(banded.inputs()[6].width(), 3);

    JacobianWorkMemory block(6, JacobianSparsity::blockDiagonal(2));
    EXPECT_EQ(block.seedWidth(), 2);
    EXPECT_EQ(block.outputs()[5].width(), 2);
}

TEST(WorkMemoryTest, DenseSeedingIsIdentity) {
    JacobianWorkMemory work(3);
    VectorX x(3);
    x << 1.0, 2.0, 3.0;

    work.seed(x);

    for (Index j = 0; j < 3; ++j) {
        const Dual& xj = work.inputs()[static_cast<std::size_t>(j)];
        EXPECT_DOUBLE_EQ(xj.value(), x[j]);
        for (Index k = 0; k < 3; ++k) {
            EXPECT_DOUBLE_EQ(xj.derivative(k), j == k ? 1.0 : 0.0);
        }
    }
}

TEST(WorkMemoryTest, BandedSeedingIsCyclic) {
    JacobianWorkMemory work(7, JacobianSparsity::banded(3));
    VectorX x = VectorX::LinSpaced(7, 0.0, 6.0);

    // Dirty the inputs to make sure seeding clears them
    for (auto& xi : work.inputs()) {
        xi.derivatives().setConstant(9.0);
    }

    work.seed(x);

    for (Index j = 0; j < 7; ++j) {
        const Dual& xj = work.inputs()[static_cast<std::size_t>(j)];
        EXPECT_DOUBLE_EQ(xj.value(), static_cast<Real>(j));
        for (Index k = 0; k < 3; ++k) {
            EXPECT_DOUBLE_EQ(xj.derivative(k), k == j % 3 ? 1.0 : 0.0)
                << "variable " << j << ", direction " << k;
        }
    }
}

TEST(WorkMemoryTest, BlockSeedingUsesLocalColumn) {
    JacobianWorkMemory work(6, JacobianSparsity::blockDiagonal(3));
    work.seed(VectorX::Ones(6));

    // Variable 4 is local column 1 of block 1
    EXPECT_DOUBLE_EQ(work.inputs()[4].derivative(1), 1.0);
    EXPECT_DOUBLE_EQ(work.inputs()[4].derivative(0), 0.0);
    EXPECT_DOUBLE_EQ(work.inputs()[4].derivative(2), 0.0);
}

TEST(WorkMemoryTest, SeedSizeMismatch) {
    JacobianWorkMemory work(4);
    EXPECT_THROW(work.seed(VectorX::Zero(3)), ShapeMismatchError);
}

TEST(WorkMemoryTest, ResetOutputs) {
    JacobianWorkMemory work(3, JacobianSparsity::banded(3));
    work.outputs()[1] = Dual(5.0);
    work.outputs()[2].value() = 7.0;
    work.outputs()[2].derivatives().setOnes();

    work.resetOutputs();

    for (const auto& fi : work.outputs()) {
        EXPECT_DOUBLE_EQ(fi.value(), 0.0);
        ASSERT_EQ(fi.width(), 3);
        EXPECT_DOUBLE_EQ(fi.derivatives().cwiseAbs().sum(), 0.0);
    }
}

TEST(WorkMemoryTest, InvalidConfiguration) {
    EXPECT_THROW(JacobianWorkMemory(8, JacobianSparsity::banded(4)), ConfigurationError);
    EXPECT_THROW(JacobianWorkMemory(4, JacobianSparsity::blockDiagonal(3)), ConfigurationError);
    EXPECT_THROW(JacobianWorkMemory(4, JacobianSparsity(JacobianSparsity::Type::BANDED)),
                 ConfigurationError);
    EXPECT_THROW(JacobianWorkMemory(-1), ConfigurationError);
}

TEST(WorkMemoryTest, Matches) {
    JacobianWorkMemory work(5, JacobianSparsity::banded(3));
    EXPECT_TRUE(work.matches(JacobianSparsity::banded(3), 5));
    EXPECT_FALSE(work.matches(JacobianSparsity::banded(5), 5));
    EXPECT_FALSE(work.matches(JacobianSparsity::banded(3), 6));
    EXPECT_FALSE(work.matches(JacobianSparsity::dense(), 5));
}
