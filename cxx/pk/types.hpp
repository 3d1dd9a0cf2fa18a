#pragma once

// Intellisense gives false positives with Eigen+ARM
#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>

#include <memory>

using Index = Eigen::Index;

namespace pk {

using Re = double;

/* Every point handed to an operator is a dense column-major matrix. Vectors are n x 1. */
using Matrix = Eigen::Matrix<Re, Eigen::Dynamic, Eigen::Dynamic>;
using Vector = Eigen::Matrix<Re, Eigen::Dynamic, 1>;
using Array = Eigen::Array<Re, Eigen::Dynamic, 1>;

using MatrixMap = Eigen::Map<Matrix>;
using MatrixCMap = Eigen::Map<Matrix const>;
using VectorMap = Eigen::Map<Vector>;
using VectorCMap = Eigen::Map<Vector const>;

} // namespace pk
