#pragma once

#include "prox.hpp"

namespace pk::Proxs {

/* Projection onto the non-negative orthant. ρ plays no part. */
struct NonNegative final : Prox
{
  PROX_INHERIT
  static auto Make() -> Prox::Ptr;
  NonNegative();
  void apply(Re const ρ, CMap v, Map z) const;
  auto objective(Matrix const &θ) const -> Re; // Indicator function, 0 or +∞
};

/*
 * Projection onto the cone of symmetric positive semi-definite matrices. The input is symmetrized first.
 * The objective is not implemented.
 */
struct SemidefiniteCone final : Prox
{
  PROX_INHERIT
  static auto Make() -> Prox::Ptr;
  SemidefiniteCone();
  void apply(Re const ρ, CMap v, Map z) const;
};

} // namespace pk::Proxs
