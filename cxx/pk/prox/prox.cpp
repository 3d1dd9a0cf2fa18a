#include "prox.hpp"

#include "../log/log.hpp"

#include <cmath>
#include <limits>

namespace pk::Proxs {

Prox::Prox(std::string const &n)
  : name{n}
{
}

auto Prox::apply(Re const ρ, Matrix const &v) const -> Matrix
{
  if (!(ρ > 0.) || !std::isfinite(ρ)) { throw Log::ConfigFailure(name, "Weight ρ must be positive and finite, was {}", ρ); }
  Matrix z(v.rows(), v.cols());
  Map    zm(z.data(), z.rows(), z.cols());
  this->apply(ρ, CMap(v.data(), v.rows(), v.cols()), zm);
  return z;
}

auto Prox::objective(Matrix const &) const -> Re { return std::numeric_limits<Re>::quiet_NaN(); }

Function::Function(Func f)
  : Prox("Func")
  , func{std::move(f)}
{
  if (!func) { throw Log::ConfigFailure("Func", "Cannot wrap an empty function"); }
}

auto Function::Make(Func f) -> Prox::Ptr { return std::make_shared<Function>(std::move(f)); }

void Function::apply(Re const ρ, CMap v, Map z) const
{
  Matrix const out = func(ρ, v);
  if (out.rows() != v.rows() || out.cols() != v.cols()) {
    throw Log::ConfigFailure(name, "Function returned {}x{} for a {}x{} input", out.rows(), out.cols(), v.rows(), v.cols());
  }
  z = out;
}

} // namespace pk::Proxs
