#pragma once

#include "lbfgs.hpp"
#include "prox.hpp"
#include "tvd.hpp"

#include "../log/log.hpp"

#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <type_traits>
#include <vector>

namespace pk::Proxs {

/* Named construction arguments. Only the ones an operator takes may be set. */
struct Opts
{
  std::optional<Re>     penalty;   // nucnorm, sparse, tvd, smooth
  std::optional<Index>  axis;      // smooth
  std::optional<Matrix> A, b;      // linsys
  std::optional<Matrix> reference; // squared_error
  SmoothObjective::ObjGrad f_df;   // lbfgs
  std::optional<Index>  numIter;   // lbfgs, defaults to 20
  TV::Denoiser          denoiser;  // tvd, defaults to split-Bregman

  auto given() const -> std::vector<std::string>;
};

struct Entry
{
  std::vector<std::string>                     args; // Accepted keys in Opts
  std::function<Prox::Ptr(Opts const &opts)> make;
};

auto Registry() -> std::map<std::string, Entry> const &;
auto Names() -> std::vector<std::string>;

/* Build a registered operator. Unknown names and bad arguments throw Log::ConfigFailure here, not on first use. */
auto Make(std::string const &name, Opts const &opts = Opts()) -> Prox::Ptr;

/*
 * Wrap a callable as an operator. Leading arguments are bound in front, so the result calls f(args..., ρ, v).
 * The objective of the wrapped operator is NaN.
 */
template <typename F, typename... Args>
  requires std::invocable<std::decay_t<F> &, std::decay_t<Args> &..., Re, Matrix const &> &&
           std::convertible_to<std::invoke_result_t<std::decay_t<F> &, std::decay_t<Args> &..., Re, Matrix const &>, Matrix>
auto Make(F &&f, Args &&...args) -> Prox::Ptr
{
  if constexpr (std::is_constructible_v<bool, F &>) {
    if (!static_cast<bool>(f)) { throw Log::ConfigFailure("Proxs", "Cannot make an operator from an empty callable"); }
  }
  return Function::Make(std::bind_front(std::forward<F>(f), std::forward<Args>(args)...));
}

} // namespace pk::Proxs
