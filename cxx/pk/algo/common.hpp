#pragma once

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "../types.hpp"

#include <cmath>
#include <string>

namespace pk {

template <typename T> inline auto PairwiseNorm(T const &x, Index st = 0, Index sz = -1) -> Re
{
  if (sz < 0) { sz = x.size(); }
  if (sz < 128) {
    return x.segment(st, sz).stableNorm();
  } else {
    auto const mid = sz / 2;
    return std::hypot(PairwiseNorm(x, st, mid), PairwiseNorm(x, st + mid, sz - mid));
  }
}

/* Frobenius norm of any contiguous dense object, split across the global pool for big inputs */
template <typename T> inline auto ParallelNorm(T const &x) -> Re
{
  VectorCMap const v(x.data(), x.size());
  if (v.size() == 0) {
    return 0.;
  } else if (v.size() < Threads::SerialLimit || Threads::InPool()) {
    return PairwiseNorm(v);
  } else {
    Index const nC = std::min<Index>(v.size(), Threads::GlobalThreadCount());
    Index const den = v.size() / nC;
    Index const rem = v.size() % nC;

    Vector         norms(nC);
    Eigen::Barrier barrier(nC);
    for (Index ic = 0; ic < nC; ic++) {
      Index const lo = ic * den + std::min(ic, rem);
      Index const hi = (ic + 1) * den + std::min(ic + 1, rem);
      Index const n = hi - lo;
      Threads::GlobalPool()->Schedule([&v, &norms, &barrier, ic, lo, n] {
        norms[ic] = PairwiseNorm(v, lo, n);
        barrier.Notify();
      });
    }
    barrier.Wait();
    return norms.norm();
  }
}

template <typename T> inline void CheckFinite(T const &x, std::string const &category, char const *what)
{
  if (!x.allFinite()) { throw Log::NumericFailure(category, "{} contained non-finite values", what); }
}

template <typename T> inline void CheckShape(T const &x, Index const rows, Index const cols, std::string const &category)
{
  if (x.rows() != rows || x.cols() != cols) {
    throw Log::ConfigFailure(category, "Input shape {}x{} did not match expected {}x{}", x.rows(), x.cols(), rows, cols);
  }
}

} // namespace pk
