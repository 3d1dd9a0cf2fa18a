#include "project.hpp"

#include "../algo/common.hpp"
#include "../algo/decomp.hpp"
#include "../log/log.hpp"
#include "../sys/threads.hpp"

#include <algorithm>
#include <limits>

namespace pk::Proxs {

auto NonNegative::Make() -> Prox::Ptr { return std::make_shared<NonNegative>(); }

NonNegative::NonNegative()
  : Prox("NonNeg")
{
}

void NonNegative::apply(Re const, CMap v, Map z) const
{
  Threads::ChunkFor(
    [&v, &z](Index lo, Index hi) {
      for (Index ii = lo; ii < hi; ii++) {
        z(ii) = std::max(v(ii), 0.);
      }
    },
    v.size());
  if (Log::IsHigh()) {
    Log::Debug(name, "|v| {:4.3E} |z| {:4.3E}", ParallelNorm(v), ParallelNorm(z));
  }
}

auto NonNegative::objective(Matrix const &θ) const -> Re
{
  return (θ.array() >= 0.).all() ? 0. : std::numeric_limits<Re>::infinity();
}

auto SemidefiniteCone::Make() -> Prox::Ptr { return std::make_shared<SemidefiniteCone>(); }

SemidefiniteCone::SemidefiniteCone()
  : Prox("PSD")
{
}

void SemidefiniteCone::apply(Re const, CMap v, Map z) const
{
  if (v.rows() != v.cols()) { throw Log::ConfigFailure(name, "Input must be square, was {}x{}", v.rows(), v.cols()); }
  Matrix const  sym = (v + v.transpose()) / 2.;
  Eig<Re> const eig(sym);
  Array const   λ = eig.V.max(0.);
  z = eig.P * λ.matrix().asDiagonal() * eig.P.transpose();
  if (Log::IsHigh()) {
    Log::Debug(name, "Clamped {} of {} eigenvalues, min {:4.3E} |v| {:4.3E} |z| {:4.3E}", (eig.V < 0.).count(), eig.V.size(),
               eig.V.size() ? eig.V.minCoeff() : 0., ParallelNorm(v), ParallelNorm(z));
  }
}

} // namespace pk::Proxs
