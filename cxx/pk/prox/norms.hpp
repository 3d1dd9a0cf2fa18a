#pragma once

#include "prox.hpp"

namespace pk::Proxs {

/* Soft-thresholding, f(x) = λ |x|_1 */
struct L1 final : Prox
{
  PROX_INHERIT
  Re          λ;
  static auto Make(Re const λ) -> Prox::Ptr;
  L1(Re const λ);
  void apply(Re const ρ, CMap v, Map z) const;
  auto objective(Matrix const &θ) const -> Re;
};

/* Singular value thresholding, f(X) = λ |X|_* */
struct NuclearNorm final : Prox
{
  PROX_INHERIT
  Re          λ;
  static auto Make(Re const λ) -> Prox::Ptr;
  NuclearNorm(Re const λ);
  void apply(Re const ρ, CMap v, Map z) const;
  auto objective(Matrix const &θ) const -> Re;
};

} // namespace pk::Proxs
