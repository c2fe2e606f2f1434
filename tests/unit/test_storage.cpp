// tests/unit/test_storage.cpp
#include <gtest/gtest.h>
#include "fwdiff/ad/JacobianStorage.hpp"
#include "fwdiff/core/Error.hpp"
#include <algorithm>
#include <cstdlib>

using namespace fwdiff;
using namespace fwdiff::ad;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Pentadiagonal 6x6 with J(i, j) = 10 i + j + 1 inside the band
        band = MatrixX::Zero(5, 6);
        for (Index j = 0; j < 6; ++j) {
            for (Index i = std::max<Index>(0, j - 2); i <= std::min<Index>(5, j + 2); ++i) {
                band(i - j + 2, j) = 10.0 * i + j + 1.0;
            }
        }
    }

    MatrixX band;
};

TEST_F(StorageTest, BandedToDense) {
    MatrixX dense = bandedToDense(band, 5);

    ASSERT_EQ(dense.rows(), 6);
    ASSERT_EQ(dense.cols(), 6);
    for (Index i = 0; i < 6; ++i) {
        for (Index j = 0; j < 6; ++j) {
            Real expected = std::abs(i - j) <= 2 ? 10.0 * i + j + 1.0 : 0.0;
            EXPECT_DOUBLE_EQ(dense(i, j), expected) << "(" << i << ", " << j << ")";
        }
    }
}

TEST_F(StorageTest, BandCornersAreIgnored) {
    // Positions outside the matrix must not leak into the dense form
    MatrixX dirty = band;
    dirty(0, 0) = 99.0;
    dirty(1, 0) = 99.0;
    dirty(4, 5) = 99.0;

    EXPECT_TRUE(bandedToDense(dirty, 5) == bandedToDense(band, 5));
}

TEST_F(StorageTest, BlockDiagonalToDense) {
    MatrixX blocks(3, 6);
    blocks << 1, 2, 3, 4, 5, 6,
              7, 8, 9, 10, 11, 12,
              13, 14, 15, 16, 17, 18;

    MatrixX dense = blockDiagonalToDense(blocks, 3);

    EXPECT_TRUE(dense.block(0, 0, 3, 3) == blocks.leftCols(3));
    EXPECT_TRUE(dense.block(3, 3, 3, 3) == blocks.rightCols(3));
    EXPECT_DOUBLE_EQ(dense.block(0, 3, 3, 3).cwiseAbs().sum(), 0.0);
    EXPECT_DOUBLE_EQ(dense.block(3, 0, 3, 3).cwiseAbs().sum(), 0.0);
}

TEST_F(StorageTest, DenseIsPassedThrough) {
    MatrixX m = MatrixX::Random(4, 4);
    EXPECT_TRUE(toDense(m, JacobianSparsity::dense()) == m);
}

TEST_F(StorageTest, SparseKeepsPattern) {
    SparseMatrix sparse = toSparse(band, JacobianSparsity::banded(5));

    // 6 + 2*5 + 2*4 positions inside a width-5 band of a 6x6 matrix
    EXPECT_EQ(sparse.nonZeros(), 24);
    EXPECT_TRUE(MatrixX(sparse) == bandedToDense(band, 5));

    MatrixX blocks = MatrixX::Zero(2, 4);
    SparseMatrix blockSparse = toSparse(blocks, JacobianSparsity::blockDiagonal(2));

    // Stored zeros inside the blocks are kept as structural entries
    EXPECT_EQ(blockSparse.nonZeros(), 8);
}

TEST_F(StorageTest, WrongRowCount) {
    EXPECT_THROW(bandedToDense(band, 3), ShapeMismatchError);
    EXPECT_THROW(blockDiagonalToDense(MatrixX::Zero(3, 4), 2), ShapeMismatchError);
    EXPECT_THROW(toDense(MatrixX::Zero(3, 4), JacobianSparsity::dense()), ShapeMismatchError);
}

TEST_F(StorageTest, InvalidPattern) {
    EXPECT_THROW(bandedToDense(MatrixX::Zero(4, 6), 4), ConfigurationError);
    EXPECT_THROW(blockDiagonalToDense(MatrixX::Zero(4, 6), 4), ConfigurationError);
}
