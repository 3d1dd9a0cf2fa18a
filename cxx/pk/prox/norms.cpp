#include "norms.hpp"

#include "../algo/common.hpp"
#include "../algo/decomp.hpp"
#include "../log/log.hpp"
#include "../sys/threads.hpp"

namespace pk::Proxs {

namespace {
void CheckPenalty(std::string const &name, Re const λ)
{
  if (!(λ >= 0.) || !std::isfinite(λ)) { throw Log::ConfigFailure(name, "Penalty must be non-negative and finite, was {}", λ); }
}
} // namespace

auto L1::Make(Re const λ) -> Prox::Ptr { return std::make_shared<L1>(λ); }

L1::L1(Re const λ_)
  : Prox("L1")
  , λ{λ_}
{
  CheckPenalty(name, λ);
  Log::Print(name, "λ {}", λ);
}

void L1::apply(Re const ρ, CMap v, Map z) const
{
  Re const t = λ / ρ;
  Threads::ChunkFor(
    [t, &v, &z](Index lo, Index hi) {
      for (Index ii = lo; ii < hi; ii++) {
        Re const x = v(ii);
        z(ii) = x > t ? x - t : (x < -t ? x + t : 0.);
      }
    },
    v.size());
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} λ {:4.3E} t {:4.3E} |v| {:4.3E} |z| {:4.3E}", ρ, λ, t, ParallelNorm(v), ParallelNorm(z));
  }
}

auto L1::objective(Matrix const &θ) const -> Re { return θ.cwiseAbs().sum(); }

auto NuclearNorm::Make(Re const λ) -> Prox::Ptr { return std::make_shared<NuclearNorm>(λ); }

NuclearNorm::NuclearNorm(Re const λ_)
  : Prox("NucNorm")
  , λ{λ_}
{
  CheckPenalty(name, λ);
  Log::Print(name, "λ {}", λ);
}

void NuclearNorm::apply(Re const ρ, CMap v, Map z) const
{
  Re const        t = λ / ρ;
  SVD<Re> const   svd(v);
  Array const     s = (svd.S - t).max(0.);
  z = svd.reconstruct(s);
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} λ {:4.3E} t {:4.3E} rank {} -> {} |v| {:4.3E} |z| {:4.3E}", ρ, λ, t, (svd.S > 0.).count(),
               (s > 0.).count(), ParallelNorm(v), ParallelNorm(z));
  }
}

auto NuclearNorm::objective(Matrix const &θ) const -> Re { return SingularValues<Re>(θ).sum(); }

} // namespace pk::Proxs
