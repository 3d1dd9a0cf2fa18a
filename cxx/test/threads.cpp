#include "pk/algo/common.hpp"
#include "pk/prox/norms.hpp"
#include "pk/prox/project.hpp"
#include "pk/sys/threads.hpp"

#include <catch2/catch.hpp>

using namespace pk;

TEST_CASE("Threads", "[threads]")
{
  Matrix const big = Matrix::Random(200, 100);
  Proxs::L1    l1(0.5);

  SECTION("Thread count does not change results")
  {
    Threads::SetGlobalThreadCount(1);
    CHECK(Threads::GlobalThreadCount() == 1);
    Matrix const z1 = l1.apply(2., big);
    Re const     n1 = ParallelNorm(big);

    Threads::SetGlobalThreadCount(4);
    CHECK(Threads::GlobalThreadCount() == 4);
    Matrix const z4 = l1.apply(2., big);
    Re const     n4 = ParallelNorm(big);

    CHECK((z1 - z4).norm() == 0.);
    CHECK(n1 == Approx(n4).epsilon(1.e-12));
    CHECK(n4 == Approx(big.norm()).epsilon(1.e-12));
  }

  SECTION("Operators can run on the pool's own workers")
  {
    Threads::SetGlobalThreadCount(2);
    CHECK(!Threads::InPool());

    Proxs::NonNegative nn;
    Matrix const       e1 = l1.apply(2., big);
    Matrix const       e2 = nn.apply(1., big);
    Matrix             z1, z2;
    bool               inPool1 = false, inPool2 = false;
    Eigen::Barrier     barrier(2);
    Threads::GlobalPool()->Schedule([&] {
      inPool1 = Threads::InPool();
      z1 = l1.apply(2., big);
      barrier.Notify();
    });
    Threads::GlobalPool()->Schedule([&] {
      inPool2 = Threads::InPool();
      z2 = nn.apply(1., big);
      barrier.Notify();
    });
    barrier.Wait();
    CHECK(inPool1);
    CHECK(inPool2);
    CHECK((z1 - e1).norm() == 0.);
    CHECK((z2 - e2).norm() == 0.);
  }

  SECTION("Chunks cover every index once")
  {
    Threads::SetGlobalThreadCount(3);
    Index const           n = 3 * Threads::SerialLimit + 7;
    Eigen::ArrayXi        hits = Eigen::ArrayXi::Zero(n);
    Threads::ChunkFor(
      [&hits](Index lo, Index hi) {
        for (Index ii = lo; ii < hi; ii++) {
          hits[ii] += 1;
        }
      },
      n);
    CHECK((hits == 1).all());
  }

  Threads::SetGlobalThreadCount(0);
}
