// tests/unit/test_sparsity.cpp
#include <gtest/gtest.h>
#include "fwdiff/ad/JacobianSparsity.hpp"
#include "fwdiff/core/Error.hpp"
#include <sstream>

using namespace fwdiff;
using namespace fwdiff::ad;

namespace {
    ErrorCode validationError(const JacobianSparsity& sparsity, Index n) {
        try {
            sparsity.validate(n);
        } catch (const ConfigurationError& ex) {
            return ex.code();
        }
        ADD_FAILURE() << sparsity.describe() << " unexpectedly valid for n = " << n;
        return ErrorCode::SHAPE_MISMATCH;
    }
}

TEST(SparsityTest, SeedWidth) {
    EXPECT_EQ(JacobianSparsity::dense().seedWidth(7), 7);
    EXPECT_EQ(JacobianSparsity::banded(3).seedWidth(7), 3);
    EXPECT_EQ(JacobianSparsity::blockDiagonal(2).seedWidth(8), 2);
}

TEST(SparsityTest, StorageShape) {
    EXPECT_EQ(JacobianSparsity::dense().storageShape(5), (JacobianSparsity::Shape{5, 5}));
    EXPECT_EQ(JacobianSparsity::banded(3).storageShape(5), (JacobianSparsity::Shape{3, 5}));
    EXPECT_EQ(JacobianSparsity::blockDiagonal(2).storageShape(4), (JacobianSparsity::Shape{2, 4}));
}

TEST(SparsityTest, CyclicSeedSlots) {
    JacobianSparsity banded = JacobianSparsity::banded(3);
    EXPECT_EQ(banded.seedSlot(0, 7), 0);
    EXPECT_EQ(banded.seedSlot(2, 7), 2);
    EXPECT_EQ(banded.seedSlot(3, 7), 0);
    EXPECT_EQ(banded.seedSlot(6, 7), 0);
    EXPECT_EQ(banded.halfBandwidth(), 1);

    EXPECT_EQ(JacobianSparsity::dense().seedSlot(5, 7), 5);
}

TEST(SparsityTest, ValidDescriptors) {
    EXPECT_NO_THROW(JacobianSparsity::dense().validate(4));
    EXPECT_NO_THROW(JacobianSparsity::banded(1).validate(4));
    EXPECT_NO_THROW(JacobianSparsity::banded(3).validate(3));
    EXPECT_NO_THROW(JacobianSparsity::blockDiagonal(4).validate(4));
    EXPECT_NO_THROW(JacobianSparsity::blockDiagonal(3).validate(9));
}

TEST(SparsityTest, InvalidBandwidth) {
    EXPECT_EQ(validationError(JacobianSparsity::banded(4), 8), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(validationError(JacobianSparsity::banded(0), 8), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(validationError(JacobianSparsity::banded(-3), 8), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(validationError(JacobianSparsity::banded(9), 8), ErrorCode::INVALID_PARAMETER);

    // Bandwidth absent
    JacobianSparsity missing(JacobianSparsity::Type::BANDED);
    EXPECT_EQ(validationError(missing, 8), ErrorCode::INVALID_PARAMETER);
    EXPECT_THROW(missing.seedWidth(8), ConfigurationError);
}

TEST(SparsityTest, InvalidBlocksize) {
    EXPECT_EQ(validationError(JacobianSparsity::blockDiagonal(3), 4), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(validationError(JacobianSparsity::blockDiagonal(0), 4), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(validationError(JacobianSparsity::blockDiagonal(5), 4), ErrorCode::INVALID_PARAMETER);

    // A bandwidth does not stand in for a blocksize
    JacobianSparsity missing(JacobianSparsity::Type::BLOCK_DIAGONAL, 2, std::nullopt);
    EXPECT_EQ(validationError(missing, 4), ErrorCode::INVALID_PARAMETER);
}

TEST(SparsityTest, UnknownType) {
    JacobianSparsity bogus(static_cast<JacobianSparsity::Type>(7), 3, 3);
    EXPECT_EQ(validationError(bogus, 6), ErrorCode::UNKNOWN_SPARSITY);
    EXPECT_THROW(bogus.seedWidth(6), ConfigurationError);
}

TEST(SparsityTest, ParseTypeNames) {
    EXPECT_EQ(parseSparsityType("dense"), JacobianSparsity::Type::DENSE);
    EXPECT_EQ(parseSparsityType("Banded"), JacobianSparsity::Type::BANDED);
    EXPECT_EQ(parseSparsityType("block-diagonal"), JacobianSparsity::Type::BLOCK_DIAGONAL);
    EXPECT_EQ(parseSparsityType("BLOCK_DIAGONAL"), JacobianSparsity::Type::BLOCK_DIAGONAL);

    try {
        parseSparsityType("tridiagonal");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::UNKNOWN_SPARSITY);
    }
}

TEST(SparsityTest, Equality) {
    EXPECT_EQ(JacobianSparsity::banded(3), JacobianSparsity::banded(3));
    EXPECT_NE(JacobianSparsity::banded(3), JacobianSparsity::banded(5));
    EXPECT_NE(JacobianSparsity::banded(3), JacobianSparsity::blockDiagonal(3));
    EXPECT_EQ(JacobianSparsity::dense(), JacobianSparsity());
}

TEST(SparsityTest, Describe) {
    std::ostringstream os;
    os << JacobianSparsity::banded(5);
    EXPECT_EQ(os.str(), "banded(bandwidth=5)");
    EXPECT_EQ(JacobianSparsity::blockDiagonal(2).describe(), "block_diagonal(blocksize=2)");
    EXPECT_EQ(JacobianSparsity::dense().describe(), "dense");
}
