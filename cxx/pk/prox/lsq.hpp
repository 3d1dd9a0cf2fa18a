#pragma once

#include "prox.hpp"

namespace pk::Proxs {

/*
 * f(x) = ½|Ax - b|^2
 *
 * A'A and A'b are formed once. Each call factorizes ρI + A'A, which is positive definite for ρ > 0.
 */
struct LinearSystem final : Prox
{
  PROX_INHERIT
  static auto Make(Matrix const &A, Matrix const &b) -> Prox::Ptr;
  LinearSystem(Matrix const &A, Matrix const &b);
  void apply(Re const ρ, CMap v, Map z) const;
  auto objective(Matrix const &θ) const -> Re;

private:
  Matrix A, b, P, q;
};

/* f(x) = ½|x - y|^2 for a fixed y, which is copied on construction */
struct SquaredError final : Prox
{
  PROX_INHERIT
  static auto Make(Matrix const &y) -> Prox::Ptr;
  SquaredError(Matrix const &y);
  void apply(Re const ρ, CMap v, Map z) const;
  auto objective(Matrix const &θ) const -> Re; // |θ - y|, the distance rather than the half-squared value

private:
  Matrix y;
};

} // namespace pk::Proxs
