#pragma once

#include "../types.hpp"

#include <functional>
#include <limits>

namespace pk {

/*
 * Limited-memory BFGS with simple (elementwise, constant) bounds.
 *
 * Variables sitting on a bound with the gradient pointing outwards are held fixed for the step,
 * the two-loop direction is computed over the remaining free variables, and the line search
 * projects every trial point back into the box.
 */
struct LBFGS
{
  /* Returns f(x) and writes ∇f(x) into g (already sized) */
  using Func = std::function<Re(Vector const &x, Vector &g)>;
  using DebugX = std::function<void(Index const, Vector const &, Re const)>;

  struct Opts
  {
    Index imax = 20;      // Outer iterations
    Index memory = 10;    // Number of correction pairs kept
    Index lsMax = 20;     // Backtracking steps per line search
    Re    gTol = 1.e-5;   // Stop when the projected gradient max-norm drops below this
    Re    fTol = 2.2e-9;  // Stop when the relative reduction in f drops below this
    Re    c1 = 1.e-4;     // Armijo constant
    Re    lower = -std::numeric_limits<Re>::infinity();
    Re    upper = std::numeric_limits<Re>::infinity();
  };

  Func   f;
  Opts   opts;
  DebugX debug = nullptr;

  auto run(Vector const &x0) const -> Vector;

private:
  auto project(Vector const &x) const -> Vector;
};

} // namespace pk
