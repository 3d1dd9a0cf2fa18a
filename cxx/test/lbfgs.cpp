#include "pk/algo/lbfgs.hpp"
#include "pk/log/log.hpp"
#include "pk/prox/lbfgs.hpp"
#include "pk/prox/lsq.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <thread>

using namespace pk;

TEST_CASE("LBFGS", "[lbfgs]")
{
  Index const n = 8;
  Vector const c = Vector::Random(n) * 2.;

  SECTION("Quadratic")
  {
    LBFGS::Opts opts;
    opts.imax = 50;
    LBFGS lbfgs{[&c](Vector const &x, Vector &g) {
                  g = x - c;
                  return 0.5 * g.squaredNorm();
                },
                opts};
    Vector const x = lbfgs.run(Vector::Zero(n));
    INFO("x " << x.transpose() << "\nc " << c.transpose());
    CHECK((x - c).norm() == Approx(0.).margin(1.e-5));
  }

  SECTION("Bounds")
  {
    LBFGS::Opts opts;
    opts.imax = 50;
    opts.lower = -0.5;
    opts.upper = 0.5;
    LBFGS lbfgs{[&c](Vector const &x, Vector &g) {
                  g = x - c;
                  return 0.5 * g.squaredNorm();
                },
                opts};
    Vector const x = lbfgs.run(Vector::Zero(n));
    Vector const e = c.cwiseMax(-0.5).cwiseMin(0.5);
    INFO("x " << x.transpose() << "\ne " << e.transpose());
    CHECK((x - e).norm() == Approx(0.).margin(1.e-5));
    CHECK((x.array() >= -0.5).all());
    CHECK((x.array() <= 0.5).all());
  }

  SECTION("Non-quadratic")
  {
    // Minimum of exp(x) + x²/2 is where exp(x) = -x
    LBFGS::Opts opts;
    opts.imax = 100;
    opts.fTol = 0.;
    opts.gTol = 1.e-10;
    LBFGS lbfgs{[](Vector const &x, Vector &g) {
                  g = x.array().exp().matrix() + x;
                  return x.array().exp().sum() + 0.5 * x.squaredNorm();
                },
                opts};
    Vector const x = lbfgs.run(Vector::Ones(n) * 3.);
    CHECK((x.array() + 0.5671432904097838).matrix().norm() == Approx(0.).margin(1.e-6));
  }

  SECTION("Debug callback")
  {
    Index calls = 0;
    LBFGS lbfgs{[&c](Vector const &x, Vector &g) {
                  g = x - c;
                  return 0.5 * g.squaredNorm();
                },
                LBFGS::Opts(), [&calls](Index const, Vector const &, Re const) { calls++; }};
    lbfgs.run(Vector::Zero(n));
    CHECK(calls > 0);
    CHECK(calls <= 20);
  }

  SECTION("Non-finite start")
  {
    LBFGS lbfgs{[](Vector const &x, Vector &g) {
                  g = x;
                  return std::log(x.minCoeff());
                },
                LBFGS::Opts()};
    CHECK_THROWS_AS(lbfgs.run(-Vector::Ones(n)), Log::NumericFailure);
  }

  SECTION("Bad options")
  {
    LBFGS::Opts opts;
    opts.lower = 1.;
    opts.upper = 0.;
    LBFGS lbfgs{[](Vector const &x, Vector &g) {
                  g = x;
                  return 0.5 * x.squaredNorm();
                },
                opts};
    CHECK_THROWS_AS(lbfgs.run(Vector::Zero(n)), Log::ConfigFailure);
    LBFGS empty;
    CHECK_THROWS_AS(empty.run(Vector::Zero(n)), Log::ConfigFailure);
  }
}

TEST_CASE("LBFGSProx", "[lbfgs]")
{
  Matrix const A = Matrix::Random(6, 4);
  Matrix const b = Matrix::Random(6, 2);
  auto         f_df = [&A, &b](Matrix const &θ) -> std::tuple<Re, Matrix> {
    Matrix const r = A * θ - b;
    return {0.5 * r.squaredNorm(), A.transpose() * r};
  };
  LBFGS::Opts opts;
  opts.imax = 200;
  opts.fTol = 0.;
  opts.gTol = 1.e-10;

  SECTION("Agrees with the direct solve")
  {
    Proxs::SmoothObjective numeric(f_df, opts);
    Proxs::LinearSystem    direct(A, b);
    Matrix const           v = Matrix::Random(4, 2);
    for (Re const ρ : {0.1, 1., 10.}) {
      Matrix const zn = numeric.apply(ρ, v);
      Matrix const zd = direct.apply(ρ, v);
      INFO("ρ " << ρ << "\nnumeric\n" << zn << "\ndirect\n" << zd);
      CHECK((zn - zd).norm() == Approx(0.).margin(1.e-6));
    }
    // Only f, the augmentation is not part of the objective
    CHECK(numeric.objective(v) == Approx(direct.objective(v)));
  }

  SECTION("Bounds")
  {
    LBFGS::Opts bounded = opts;
    bounded.lower = 0.;
    Proxs::SmoothObjective prox(f_df, bounded);
    Matrix const           z = prox.apply(1., Matrix::Random(4, 2));
    CHECK((z.array() >= 0.).all());
  }

  SECTION("Independent instances on separate threads")
  {
    Proxs::SmoothObjective p1(f_df, opts), p2(f_df, opts);
    Matrix const           v1 = Matrix::Random(4, 2), v2 = Matrix::Random(4, 2);
    Matrix const           e1 = p1.apply(0.5, v1), e2 = p2.apply(2., v2);
    Matrix                 z1, z2;
    std::thread            t1([&] { z1 = p1.apply(0.5, v1); });
    std::thread            t2([&] { z2 = p2.apply(2., v2); });
    t1.join();
    t2.join();
    CHECK((z1 - e1).norm() == Approx(0.).margin(1.e-12));
    CHECK((z2 - e2).norm() == Approx(0.).margin(1.e-12));
  }

  SECTION("Wrong gradient shape")
  {
    Proxs::SmoothObjective prox([](Matrix const &θ) -> std::tuple<Re, Matrix> { return {θ.sum(), θ.transpose()}; }, opts);
    CHECK_THROWS_AS(prox.apply(1., Matrix::Random(4, 2)), Log::ConfigFailure);
  }

  SECTION("Non-finite start")
  {
    auto bad = [](Matrix const &θ) -> std::tuple<Re, Matrix> {
      return {std::numeric_limits<Re>::quiet_NaN(), Matrix::Zero(θ.rows(), θ.cols())};
    };
    auto prox = Proxs::SmoothObjective::Make(bad);
    CHECK_THROWS_AS(prox->apply(1., Matrix::Random(4, 2)), Log::NumericFailure);
  }

  CHECK_THROWS_AS(Proxs::SmoothObjective::Make(f_df, 0), Log::ConfigFailure);
  CHECK_THROWS_AS(Proxs::SmoothObjective::Make(nullptr), Log::ConfigFailure);
}
