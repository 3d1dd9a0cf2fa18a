#include "lsq.hpp"

#include "../algo/common.hpp"
#include "../log/log.hpp"

#include <Eigen/Cholesky>

namespace pk::Proxs {

auto LinearSystem::Make(Matrix const &A, Matrix const &b) -> Prox::Ptr { return std::make_shared<LinearSystem>(A, b); }

LinearSystem::LinearSystem(Matrix const &A_, Matrix const &b_)
  : Prox("LinSys")
  , A{A_}
  , b{b_}
{
  if (A.rows() != b.rows()) { throw Log::ConfigFailure(name, "A has {} rows but b has {}", A.rows(), b.rows()); }
  if (A.size() == 0) { throw Log::ConfigFailure(name, "A was empty"); }
  CheckFinite(A, name, "A");
  CheckFinite(b, name, "b");
  P = A.transpose() * A;
  q = A.transpose() * b;
  Log::Print(name, "A {}x{} b {}x{} |A'b| {:4.3E}", A.rows(), A.cols(), b.rows(), b.cols(), ParallelNorm(q));
}

void LinearSystem::apply(Re const ρ, CMap v, Map z) const
{
  CheckShape(v, q.rows(), q.cols(), name);
  Matrix H = P;
  H.diagonal().array() += ρ;
  Eigen::LLT<Matrix> const llt(H);
  if (llt.info() != Eigen::Success) { throw Log::NumericFailure(name, "Cholesky factorization of ρI + A'A failed, ρ {}", ρ); }
  z = llt.solve(ρ * v + q);
  CheckFinite(z, name, "Solution");
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} |v| {:4.3E} |z| {:4.3E}", ρ, ParallelNorm(v), ParallelNorm(z));
  }
}

auto LinearSystem::objective(Matrix const &θ) const -> Re
{
  CheckShape(θ, q.rows(), q.cols(), name);
  return 0.5 * (A * θ - b).squaredNorm();
}

auto SquaredError::Make(Matrix const &y) -> Prox::Ptr { return std::make_shared<SquaredError>(y); }

SquaredError::SquaredError(Matrix const &y_)
  : Prox("SqErr")
  , y{y_}
{
  Log::Print(name, "y {}x{} |y| {:4.3E}", y.rows(), y.cols(), ParallelNorm(y));
}

void SquaredError::apply(Re const ρ, CMap v, Map z) const
{
  CheckShape(v, y.rows(), y.cols(), name);
  z = (v + y / ρ) / (1. + 1. / ρ);
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} |v| {:4.3E} |z| {:4.3E}", ρ, ParallelNorm(v), ParallelNorm(z));
  }
}

auto SquaredError::objective(Matrix const &θ) const -> Re
{
  CheckShape(θ, y.rows(), y.cols(), name);
  return (y - θ).norm();
}

} // namespace pk::Proxs
