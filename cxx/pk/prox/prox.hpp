#pragma once

#include "../types.hpp"

#include <functional>
#include <string>

namespace pk::Proxs {

/*
 * A proximal operator, prox_{f/ρ}(v) = argmin_x f(x) + (ρ/2)|x - v|^2
 *
 * Parameters are fixed at construction. apply() never modifies its input and keeps no state between calls,
 * so separate instances can be used from separate threads. Calls on the same instance must not overlap.
 */
struct Prox
{
  using Matrix = pk::Matrix;
  using Map = MatrixMap;
  using CMap = MatrixCMap;
  using Ptr = std::shared_ptr<Prox>;

  Prox(std::string const &name);

  auto         apply(Re const ρ, Matrix const &v) const -> Matrix; // Checks ρ then calls the variant below
  virtual void apply(Re const ρ, CMap v, Map z) const = 0;          // z is sized like v and does not alias it
  virtual auto objective(Matrix const &θ) const -> Re;               // NaN unless the variant can evaluate it

  auto operator()(Re const ρ, Matrix const &v) const -> Matrix { return apply(ρ, v); }

  virtual ~Prox() {};

  std::string name;
};

#define PROX_INHERIT                                                                                                           \
  using Matrix = typename Prox::Matrix;                                                                                        \
  using Map = typename Prox::Map;                                                                                              \
  using CMap = typename Prox::CMap;                                                                                            \
  using Ptr = Prox::Ptr;                                                                                                       \
  using Prox::apply;

/* Wraps a bare mapping so it satisfies the whole interface. The objective is unknown. */
struct Function final : Prox
{
  PROX_INHERIT
  using Func = std::function<Matrix(Re const ρ, Matrix const &v)>;

  static auto Make(Func f) -> Prox::Ptr;
  Function(Func f);

  void apply(Re const ρ, CMap v, Map z) const;

private:
  Func func;
};

} // namespace pk::Proxs
