#pragma once

#include "prox.hpp"

namespace pk::Proxs {

/*
 * Total-variation denoising, f(X) = γ TV(X), delegated to a denoiser called with strength ρ/γ.
 * The default denoiser is split-Bregman. Without a denoiser apply() throws Log::MissingBackend.
 */
struct TV final : Prox
{
  PROX_INHERIT
  using Denoiser = std::function<Matrix(Matrix const &x, Re const weight)>;

  static auto DefaultDenoiser() -> Denoiser;
  static auto Make(Re const γ) -> Prox::Ptr;
  static auto Make(Re const γ, Denoiser d) -> Prox::Ptr;
  TV(Re const γ, Denoiser d);
  void apply(Re const ρ, CMap v, Map z) const;

  Re γ;

private:
  Denoiser denoise;
};

} // namespace pk::Proxs
