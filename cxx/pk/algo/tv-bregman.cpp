#include "tv-bregman.hpp"

#include "../log/log.hpp"
#include "common.hpp"

#include <cmath>
#include <limits>

namespace pk {

auto TVBregman::run(Matrix const &f, Re const weight) const -> Matrix
{
  if (!(weight > 0.) || !std::isfinite(weight)) { throw Log::ConfigFailure("TVB", "Weight must be positive and finite, was {}", weight); }
  if (opts.imax < 1) { throw Log::ConfigFailure("TVB", "Requires at least 1 iteration"); }
  Index const rows = f.rows();
  Index const cols = f.cols();
  if (rows == 0 || cols == 0) { return f; }

  Matrix u = Matrix::Zero(rows + 2, cols + 2);
  u.block(1, 1, rows, cols) = f;
  u.row(0).segment(1, cols) = f.row(0);
  u.row(rows + 1).segment(1, cols) = f.row(rows - 1);
  u.col(0) = u.col(1);
  u.col(cols + 1) = u.col(cols);

  Matrix dx = Matrix::Zero(rows + 2, cols + 2), dy = dx, bx = dx, by = dx;

  Re const λ = 2. * weight;
  Re const norm = weight + 4. * λ;
  Re       rmse = std::numeric_limits<Re>::max();
  Index    it = 0;
  for (; it < opts.imax && rmse > opts.tol; it++) {
    Re sum = 0.;
    for (Index c = 1; c <= cols; c++) {
      for (Index r = 1; r <= rows; r++) {
        Re const uprev = u(r, c);
        // Forward differences, x along columns and y along rows
        Re const ux = u(r, c + 1) - uprev;
        Re const uy = u(r + 1, c) - uprev;
        Re const unew = (λ * (u(r + 1, c) + u(r - 1, c) + u(r, c + 1) + u(r, c - 1)   //
                              + dx(r, c - 1) - dx(r, c) + dy(r - 1, c) - dy(r, c)     //
                              - bx(r, c - 1) + bx(r, c) - by(r - 1, c) + by(r, c)) +
                         weight * f(r - 1, c - 1)) /
                        norm;
        u(r, c) = unew;
        sum += (unew - uprev) * (unew - uprev);

        Re const tx = ux + bx(r, c);
        Re const ty = uy + by(r, c);
        Re       dxx, dyy;
        if (opts.isotropic) {
          Re const s = std::hypot(tx, ty);
          dxx = s * λ * tx / (s * λ + 1.);
          dyy = s * λ * ty / (s * λ + 1.);
        } else {
          Re const sx = std::abs(tx);
          Re const sy = std::abs(ty);
          dxx = sx * λ * tx / (sx * λ + 1.);
          dyy = sy * λ * ty / (sy * λ + 1.);
        }
        dx(r, c) = dxx;
        dy(r, c) = dyy;
        bx(r, c) += ux - dxx;
        by(r, c) += uy - dyy;
      }
    }
    rmse = std::sqrt(sum / (rows * cols));
    Log::Debug("TVB", "{:02d} RMS change {:4.3E}", it, rmse);
  }
  Log::Debug("TVB", "Weight {:4.3E} finished after {} sweeps, RMS change {:4.3E}", weight, it, rmse);
  Matrix out = u.block(1, 1, rows, cols);
  CheckFinite(out, "TVB", "Denoised image");
  return out;
}

auto TotalVariation(Matrix const &u) -> Re
{
  Index const rows = u.rows();
  Index const cols = u.cols();
  Re          tv = 0.;
  for (Index c = 0; c < cols; c++) {
    for (Index r = 0; r < rows; r++) {
      Re const gx = c + 1 < cols ? u(r, c + 1) - u(r, c) : 0.;
      Re const gy = r + 1 < rows ? u(r + 1, c) - u(r, c) : 0.;
      tv += std::hypot(gx, gy);
    }
  }
  return tv;
}

} // namespace pk
