#pragma once

#include "../algo/lbfgs.hpp"
#include "prox.hpp"

#include <tuple>

namespace pk::Proxs {

/*
 * Prox of a general smooth f, found numerically by minimizing f(x) + (ρ/2)|x - v|^2 with L-BFGS starting from v.
 * The result is only as good as the iteration budget allows.
 */
struct SmoothObjective final : Prox
{
  PROX_INHERIT
  using ObjGrad = std::function<std::tuple<Re, Matrix>(Matrix const &θ)>; // Returns f(θ) and ∇f(θ)

  static auto Make(ObjGrad f_df, Index const numIter = 20) -> Prox::Ptr;
  static auto Make(ObjGrad f_df, LBFGS::Opts const &opts) -> Prox::Ptr;
  SmoothObjective(ObjGrad f_df, LBFGS::Opts const &opts);
  void apply(Re const ρ, CMap v, Map z) const;
  auto objective(Matrix const &θ) const -> Re; // f(θ) alone

private:
  ObjGrad     f_df;
  LBFGS::Opts opts;
};

} // namespace pk::Proxs
