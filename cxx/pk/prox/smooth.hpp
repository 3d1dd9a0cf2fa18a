#pragma once

#include "prox.hpp"

namespace pk::Proxs {

/*
 * Smoothing along one axis of a matrix (0 = down the rows, 1 = along the columns).
 *
 * Solves γ L z = ρ v for each line, where L is tridiagonal with 2 + ρ/γ on the diagonal and -1 off it.
 * The objective is not implemented.
 */
struct Laplacian final : Prox
{
  PROX_INHERIT
  Index       axis;
  Re          γ;
  static auto Make(Index const axis, Re const γ) -> Prox::Ptr;
  Laplacian(Index const axis, Re const γ);
  void apply(Re const ρ, CMap v, Map z) const;
};

} // namespace pk::Proxs
