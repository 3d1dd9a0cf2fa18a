#include "lbfgs.hpp"

#include "../algo/common.hpp"
#include "../log/log.hpp"

namespace pk::Proxs {

auto SmoothObjective::Make(ObjGrad f_df, Index const numIter) -> Prox::Ptr
{
  LBFGS::Opts opts;
  opts.imax = numIter;
  return std::make_shared<SmoothObjective>(std::move(f_df), opts);
}

auto SmoothObjective::Make(ObjGrad f_df, LBFGS::Opts const &opts) -> Prox::Ptr
{
  return std::make_shared<SmoothObjective>(std::move(f_df), opts);
}

SmoothObjective::SmoothObjective(ObjGrad f, LBFGS::Opts const &o)
  : Prox("LBFGS")
  , f_df{std::move(f)}
  , opts{o}
{
  if (!f_df) { throw Log::ConfigFailure(name, "No objective/gradient function supplied"); }
  if (opts.imax < 1) { throw Log::ConfigFailure(name, "Iteration budget must be at least 1, was {}", opts.imax); }
  Log::Print(name, "Iterations {} memory {} bounds [{}, {}]", opts.imax, opts.memory, opts.lower, opts.upper);
}

void SmoothObjective::apply(Re const ρ, CMap v, Map z) const
{
  Index const rows = v.rows();
  Index const cols = v.cols();
  VectorCMap const vv(v.data(), v.size());

  // Everything that depends on this call lives in the closure, nothing is written to the instance
  auto augmented = [&](Vector const &θ, Vector &g) -> Re {
    auto [f, df] = f_df(MatrixCMap(θ.data(), rows, cols));
    if (df.rows() != rows || df.cols() != cols) {
      throw Log::ConfigFailure(name, "Gradient was {}x{}, expected {}x{}", df.rows(), df.cols(), rows, cols);
    }
    g = VectorCMap(df.data(), df.size()) + ρ * (θ - vv);
    return f + (ρ / 2.) * (θ - vv).squaredNorm();
  };

  LBFGS const solver{augmented, opts};
  Vector const x = solver.run(vv);
  z = MatrixCMap(x.data(), rows, cols);
  if (Log::IsHigh()) {
    Log::Debug(name, "ρ {:4.3E} |v| {:4.3E} |z| {:4.3E}", ρ, ParallelNorm(v), ParallelNorm(z));
  }
}

auto SmoothObjective::objective(Matrix const &θ) const -> Re { return std::get<0>(f_df(θ)); }

} // namespace pk::Proxs
