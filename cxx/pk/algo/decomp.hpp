#pragma once

#include "../types.hpp"

// Wrappers for dynamic decomps so only compile once

namespace pk {

/* Self-adjoint eigen-decomposition, eigenvalues in descending order */
template <typename Scalar = Re> struct Eig
{
  using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
  using RealArray = Eigen::Array<typename Eigen::NumTraits<Scalar>::Real, Eigen::Dynamic, 1>;
  Eig(Eigen::Ref<Matrix const> const &gramian);
  Matrix    P;
  RealArray V;

  auto reconstruct() const -> Matrix;
};

/* Thin SVD, mat = U * diag(S) * V' */
template <typename Scalar = Re> struct SVD
{
  using Matrix = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;
  using RealArray = Eigen::Array<typename Eigen::NumTraits<Scalar>::Real, Eigen::Dynamic, 1>;
  SVD(Eigen::Ref<Matrix const> const &mat);
  Matrix    U, V;
  RealArray S;

  auto reconstruct() const -> Matrix;
  auto reconstruct(RealArray const &s) const -> Matrix; // Same singular vectors, replacement singular values
};

/* Singular values only, without forming U or V */
template <typename Scalar = Re>
auto SingularValues(Eigen::Ref<Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> const> const &mat)
  -> Eigen::Array<typename Eigen::NumTraits<Scalar>::Real, Eigen::Dynamic, 1>;

} // namespace pk
