#pragma once

#include <Eigen/Core>
#include <Eigen/Sparse>
#include <vector>

namespace fwdiff {

// Precision configuration
#ifdef FWDIFF_SINGLE_PRECISION
using Real = float;
#else
using Real = double;
#endif

// Integer types
using Index = Eigen::Index;

// Compile-time width marker for runtime-sized derivative vectors
inline constexpr int Dynamic = Eigen::Dynamic;

// Vector types
using VectorX = Eigen::Matrix<Real, Eigen::Dynamic, 1>;

// Matrix types
using MatrixX = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic>;
using SparseMatrix = Eigen::SparseMatrix<Real>;
using Triplet = Eigen::Triplet<Real>;

} // namespace fwdiff
