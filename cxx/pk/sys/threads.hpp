#pragma once

#include "../types.hpp"

#include <algorithm>
#include <unsupported/Eigen/CXX11/ThreadPool>

namespace pk {

namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *;
auto GlobalThreadCount() -> Index;
/* Replaces the pool. Do not call while any operator is inside apply(). */
void SetGlobalThreadCount(Index n_threads);

/* Below this many elements the work runs on the calling thread */
Index constexpr SerialLimit = 4096;

/* True on a worker of the global pool. Work started there must not wait on the pool again. */
auto InPool() -> bool;

template <typename F> void ChunkFor(F const &f, Index const sz)
{
  if (sz == 0) {
    return;
  } else if (sz < SerialLimit || InPool()) {
    f(0, sz);
  } else {
    auto           pool = GlobalPool();
    Index const    nT = pool->NumThreads();
    Index const    nC = std::min<Index>(sz, nT);
    Index const    den = sz / nC;
    Index const    rem = sz % nC;
    Eigen::Barrier barrier(nC);
    for (Index it = 0; it < nC; it++) {
      Index const lo = it * den + std::min(it, rem);
      Index const hi = (it + 1) * den + std::min(it + 1, rem);
      pool->Schedule([&barrier, &f, lo, hi] {
        f(lo, hi);
        barrier.Notify();
      });
    }
    barrier.Wait();
  }
}

} // namespace Threads
} // namespace pk
