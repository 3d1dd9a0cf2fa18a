#include "tvd.hpp"

#include "../algo/common.hpp"
#include "../algo/tv-bregman.hpp"
#include "../log/log.hpp"

namespace pk::Proxs {

auto TV::DefaultDenoiser() -> Denoiser
{
  return [](Matrix const &x, Re const weight) { return TVBregman{}.run(x, weight); };
}

auto TV::Make(Re const γ) -> Prox::Ptr { return std::make_shared<TV>(γ, DefaultDenoiser()); }

auto TV::Make(Re const γ, Denoiser d) -> Prox::Ptr { return std::make_shared<TV>(γ, std::move(d)); }

TV::TV(Re const γ_, Denoiser d)
  : Prox("TV")
  , γ{γ_}
  , denoise{std::move(d)}
{
  if (!(γ > 0.) || !std::isfinite(γ)) { throw Log::ConfigFailure(name, "γ must be positive and finite, was {}", γ); }
  if (denoise) {
    Log::Print(name, "γ {}", γ);
  } else {
    Log::Warn(name, "γ {} but no denoising backend is available", γ);
  }
}

void TV::apply(Re const ρ, CMap v, Map z) const
{
  if (!denoise) { throw Log::MissingBackend(name, "No total-variation denoising backend available"); }
  Matrix const out = denoise(v, ρ / γ);
  if (out.rows() != v.rows() || out.cols() != v.cols()) {
    throw Log::NumericFailure(name, "Denoiser returned {}x{} for a {}x{} input", out.rows(), out.cols(), v.rows(), v.cols());
  }
  z = out;
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} γ {:4.3E} weight {:4.3E} |v| {:4.3E} |z| {:4.3E}", ρ, γ, ρ / γ, ParallelNorm(v), ParallelNorm(z));
  }
}

} // namespace pk::Proxs
