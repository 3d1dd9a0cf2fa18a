#pragma once

#include "../types.hpp"

namespace pk {

/*
 * Split-Bregman total-variation denoising of a 2D array (Goldstein & Osher 2009).
 *
 * Minimizes  (weight / 2) |u - f|^2 + TV(u)  with Gauss-Seidel sweeps for the u sub-problem.
 * Smaller weights give smoother results. Borders replicate the edge values of f.
 */
struct TVBregman
{
  struct Opts
  {
    Index imax = 100;      // Maximum Gauss-Seidel/Bregman sweeps
    Re    tol = 1.e-3;     // Stop when the RMS change over a sweep drops below this
    bool  isotropic = true;
  };

  Opts opts;

  auto run(Matrix const &f, Re const weight) const -> Matrix;
};

/* Isotropic total variation with forward differences, for monitoring */
auto TotalVariation(Matrix const &u) -> Re;

} // namespace pk
