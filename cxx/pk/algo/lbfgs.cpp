#include "lbfgs.hpp"

#include "../log/log.hpp"
#include "common.hpp"

#include <algorithm>
#include <deque>

namespace pk {

namespace {
struct Correction
{
  Vector s, y;
  Re     sy; // s'y
};
} // namespace

auto LBFGS::project(Vector const &x) const -> Vector { return x.cwiseMax(opts.lower).cwiseMin(opts.upper); }

auto LBFGS::run(Vector const &x0) const -> Vector
{
  if (!f) { throw Log::ConfigFailure("LBFGS", "No objective function supplied"); }
  if (opts.imax < 1) { throw Log::ConfigFailure("LBFGS", "Requires at least 1 iteration"); }
  if (opts.memory < 1) { throw Log::ConfigFailure("LBFGS", "Requires a memory of at least 1"); }
  if (!(opts.lower <= opts.upper)) { throw Log::ConfigFailure("LBFGS", "Lower bound {} exceeds upper bound {}", opts.lower, opts.upper); }

  Index const n = x0.size();
  Vector      x = project(x0);
  Vector      g(n), xn(n), gn(n), d(n);
  Re          fx = f(x, g);
  if (!std::isfinite(fx)) { throw Log::NumericFailure("LBFGS", "Objective was {} at the starting point", fx); }
  CheckFinite(g, "LBFGS", "Gradient at the starting point");

  std::deque<Correction> mem;
  if (Log::IsHigh()) {
    Log::Debug("LBFGS", "IT f         |pg|      α");
    Log::Debug("LBFGS", "{:02d} {:4.3E} {:4.3E}", 0, fx, (x - project(x - g)).lpNorm<Eigen::Infinity>());
  }
  for (Index it = 0; it < opts.imax; it++) {
    Re const pgNorm = (x - project(x - g)).lpNorm<Eigen::Infinity>();
    if (pgNorm <= opts.gTol) {
      Log::Print("LBFGS", "Projected gradient {:4.3E} below tolerance {:4.3E}", pgNorm, opts.gTol);
      break;
    }

    // Variables pinned at a bound with the gradient pushing outwards do not move this step
    Eigen::Array<bool, Eigen::Dynamic, 1> const fixed =
      ((x.array() <= opts.lower) && (g.array() > 0.)) || ((x.array() >= opts.upper) && (g.array() < 0.));
    Vector const gFree = fixed.select(0., g.array()).matrix();

    // Two-loop recursion
    d = -gFree;
    std::vector<Re> a(mem.size());
    for (Index ii = (Index)mem.size() - 1; ii >= 0; ii--) {
      a[ii] = mem[ii].s.dot(d) / mem[ii].sy;
      d -= a[ii] * mem[ii].y;
    }
    if (!mem.empty()) { d *= mem.back().sy / mem.back().y.squaredNorm(); }
    for (Index ii = 0; ii < (Index)mem.size(); ii++) {
      Re const b = mem[ii].y.dot(d) / mem[ii].sy;
      d += (a[ii] - b) * mem[ii].s;
    }
    d = fixed.select(0., d.array()).matrix();

    Re const dg = g.dot(d);
    if (!(dg < 0.)) {
      Log::Debug("LBFGS", "Not a descent direction (g'd {:4.3E}), resetting memory", dg);
      mem.clear();
      d = -gFree;
    }

    // Backtracking line search along the projected path
    Re   α = mem.empty() ? std::min(1., 1. / d.norm()) : 1.;
    Re   fn = fx;
    bool accepted = false;
    for (Index ils = 0; ils < opts.lsMax; ils++) {
      xn = project(x + α * d);
      fn = f(xn, gn);
      if (std::isfinite(fn) && gn.allFinite() && fn <= fx + opts.c1 * g.dot(xn - x)) {
        accepted = true;
        break;
      }
      α *= 0.5;
    }
    if (!accepted) {
      Log::Print("LBFGS", "Line search failed to decrease the objective, stopping");
      break;
    }

    Vector s = xn - x;
    Vector y = gn - g;
    Re const sy = s.dot(y);
    if (sy > std::numeric_limits<Re>::epsilon() * y.squaredNorm()) {
      mem.push_back({std::move(s), std::move(y), sy});
      if ((Index)mem.size() > opts.memory) { mem.pop_front(); }
    }

    Re const reduction = (fx - fn) / std::max({std::abs(fx), std::abs(fn), 1.});
    x = xn;
    g = gn;
    fx = fn;
    if (Log::IsHigh()) {
      Log::Debug("LBFGS", "{:02d} {:4.3E} {:4.3E} {:4.3E}", it + 1, fx, (x - project(x - g)).lpNorm<Eigen::Infinity>(), α);
    }
    if (debug) { debug(it, x, fx); }
    if (reduction <= opts.fTol) {
      Log::Print("LBFGS", "Relative reduction {:4.3E} below tolerance {:4.3E}", reduction, opts.fTol);
      break;
    }
  }
  return x;
}

} // namespace pk
