#include "decomp.hpp"

#include "../log/log.hpp"

#include <Eigen/Eigenvalues>
#include <Eigen/SVD>

namespace pk {

template <typename S> Eig<S>::Eig(Eigen::Ref<Matrix const> const &g)
{
  if (g.rows() != g.cols()) { throw Log::ConfigFailure("Eig", "This is for self-adjoint Eigensystems, got {}x{}", g.rows(), g.cols()); }
  Eigen::SelfAdjointEigenSolver<Matrix> eig(g);
  if (eig.info() != Eigen::Success) { throw Log::NumericFailure("Eig", "Eigen-decomposition of {}x{} matrix failed", g.rows(), g.cols()); }
  V = eig.eigenvalues().reverse();
  P = eig.eigenvectors().rowwise().reverse();
}

template <typename S> auto Eig<S>::reconstruct() const -> Matrix
{
  return P * V.matrix().template cast<S>().asDiagonal() * P.adjoint();
}

template struct Eig<double>;

template <typename Scalar> SVD<Scalar>::SVD(Eigen::Ref<Matrix const> const &mat)
{
  auto const svd = mat.bdcSvd(Eigen::ComputeThinU | Eigen::ComputeThinV);
  if (svd.info() != Eigen::Success) { throw Log::NumericFailure("SVD", "SVD of {}x{} matrix did not converge", mat.rows(), mat.cols()); }
  S = svd.singularValues();
  U = svd.matrixU();
  V = svd.matrixV();
}

template <typename Scalar> auto SVD<Scalar>::reconstruct() const -> Matrix { return reconstruct(S); }

template <typename Scalar> auto SVD<Scalar>::reconstruct(RealArray const &s) const -> Matrix
{
  if (s.size() != S.size()) { throw Log::ConfigFailure("SVD", "Expected {} singular values, got {}", S.size(), s.size()); }
  return U * s.matrix().template cast<Scalar>().asDiagonal() * V.adjoint();
}

template struct SVD<float>;
template struct SVD<double>;

template <typename S>
auto SingularValues(Eigen::Ref<Eigen::Matrix<S, Eigen::Dynamic, Eigen::Dynamic> const> const &mat)
  -> Eigen::Array<typename Eigen::NumTraits<S>::Real, Eigen::Dynamic, 1>
{
  auto const svd = mat.bdcSvd();
  if (svd.info() != Eigen::Success) { throw Log::NumericFailure("SVD", "SVD of {}x{} matrix did not converge", mat.rows(), mat.cols()); }
  return svd.singularValues();
}

template auto SingularValues<float>(Eigen::Ref<Eigen::MatrixXf const> const &) -> Eigen::ArrayXf;
template auto SingularValues<double>(Eigen::Ref<Eigen::MatrixXd const> const &) -> Eigen::ArrayXd;

} // namespace pk
