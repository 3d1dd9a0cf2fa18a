#include "smooth.hpp"

#include "../algo/common.hpp"
#include "../log/log.hpp"

#include <Eigen/SparseCholesky>
#include <Eigen/SparseCore>

#include <vector>

namespace pk::Proxs {

auto Laplacian::Make(Index const a, Re const g) -> Prox::Ptr { return std::make_shared<Laplacian>(a, g); }

Laplacian::Laplacian(Index const a, Re const g)
  : Prox("Smooth")
  , axis{a}
  , γ{g}
{
  if (axis < 0 || axis > 1) { throw Log::ConfigFailure(name, "Axis must be 0 or 1, was {}", axis); }
  if (!(γ > 0.) || !std::isfinite(γ)) { throw Log::ConfigFailure(name, "γ must be positive and finite, was {}", γ); }
  Log::Print(name, "Axis {} γ {}", axis, γ);
}

void Laplacian::apply(Re const ρ, CMap v, Map z) const
{
  // Rotate the smoothing axis to the front so every column is one line
  Matrix const x = axis == 0 ? Matrix(v) : Matrix(v.transpose());
  Index const  n = x.rows();
  if (n == 0 || x.cols() == 0) { return; }

  std::vector<Eigen::Triplet<Re>> triplets;
  triplets.reserve(3 * n);
  for (Index ii = 0; ii < n; ii++) {
    triplets.emplace_back(ii, ii, γ * (2. + ρ / γ));
    if (ii > 0) { triplets.emplace_back(ii, ii - 1, -γ); }
    if (ii + 1 < n) { triplets.emplace_back(ii, ii + 1, -γ); }
  }
  Eigen::SparseMatrix<Re> L(n, n);
  L.setFromTriplets(triplets.begin(), triplets.end());

  Eigen::SimplicialLDLT<Eigen::SparseMatrix<Re>> solver(L);
  if (solver.info() != Eigen::Success) { throw Log::NumericFailure(name, "Factorization of the {}x{} smoothing system failed", n, n); }
  Matrix const y = solver.solve(ρ * x);
  if (solver.info() != Eigen::Success) { throw Log::NumericFailure(name, "Solving the smoothing system failed"); }
  CheckFinite(y, name, "Solution");

  if (axis == 0) {
    z = y;
  } else {
    z = y.transpose();
  }
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} γ {:4.3E} |v| {:4.3E} |z| {:4.3E}", ρ, γ, ParallelNorm(v), ParallelNorm(z));
  }
}

} // namespace pk::Proxs
