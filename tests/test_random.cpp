#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <utility>

#include <cl3/core/cliffor.hpp>
#include <cl3/core/norm.hpp>
#include <cl3/random.hpp>

#include "support/cliffor_approx.hpp"
#include "support/generators.hpp"
#include "support/tolerances.hpp"

using namespace cl3::core;
using namespace cl3::sampling;
using cl3::test_support::approx;
using cl3::test_support::kTolTight;

TEST_CASE("Single-grade magnitudes stay in range") {
  auto gen = cl3::test_support::make_engine(81);
  bool saw_negative = false;
  bool saw_positive = false;

  for (int i = 0; i < 200; ++i) {
    const Cliffor r = random_r(1.0, 2.0, gen);
    CHECK(std::abs(r.a0()) >= 1.0);
    CHECK(std::abs(r.a0()) < 2.0);
    saw_negative = saw_negative || r.a0() < 0.0;
    saw_positive = saw_positive || r.a0() > 0.0;

    const double v = largest_singular_value(random_v3(1.0, 2.0, gen));
    CHECK(v >= 1.0 - kTolTight);
    CHECK(v < 2.0 + kTolTight);

    const double b = largest_singular_value(random_bv(1.0, 2.0, gen));
    CHECK(b >= 1.0 - kTolTight);
    CHECK(b < 2.0 + kTolTight);
  }
  CHECK(saw_negative);
  CHECK(saw_positive);
}

TEST_CASE("Bounds are taken by magnitude in either order") {
  auto gen = cl3::test_support::make_engine(82);
  for (int i = 0; i < 50; ++i) {
    const double m = std::abs(random_i(-3.0, 2.0, gen).a123());
    CHECK(m >= 2.0);
    CHECK(m < 3.0);
  }
}

TEST_CASE("random_of returns the requested variant") {
  auto gen = cl3::test_support::make_engine(83);
  for (Variant v : kAllVariants) {
    CHECK(random_of(v, 0.5, 1.0, gen).variant() == v);
  }

  for (int i = 0; i < 50; ++i) {
    const Cliffor x = random_cliffor(gen);
    CHECK(largest_singular_value(x) < 4.0);
  }
}

TEST_CASE("A fixed seed reproduces the sequence") {
  auto a = cl3::test_support::make_engine(84);
  auto b = cl3::test_support::make_engine(84);
  for (int i = 0; i < 20; ++i) {
    CHECK(random_cliffor(0.0, 5.0, a) == random_cliffor(0.0, 5.0, b));
  }
}

TEST_CASE("Structured samples") {
  auto gen = cl3::test_support::make_engine(85);
  for (int i = 0; i < 20; ++i) {
    const Cliffor u = random_unit_v3(gen);
    CHECK(u * u == approx(R(1), kTolTight));

    const Cliffor p = random_projector(gen);
    CHECK(p.variant() == Variant::PV);
    CHECK(p * p == approx(p, kTolTight));

    const Cliffor n = random_nilpotent(gen);
    CHECK(n.variant() == Variant::BPV);
    CHECK(n * n == approx(R(0), 1e-10));
    CHECK(largest_singular_value(n) == doctest::Approx(1.0));
  }
}

TEST_CASE("Every grade block of a sample lies in the magnitude range") {
  auto gen = cl3::test_support::make_engine(86);
  for (Variant v : kAllVariants) {
    CAPTURE(variant_name(v));
    for (int i = 0; i < 50; ++i) {
      const Cliffor x = random_of(v, 0.5, 2.0, gen);
      const std::pair<Component, Cliffor> blocks[] = {
          {kA0, to_r(x)}, {kA1, to_v3(x)}, {kA23, to_bv(x)}, {kA123, to_i(x)}};
      for (const auto &[component, block] : blocks) {
        if (!in_support(v, component))
          continue;
        const double m = largest_singular_value(block);
        CHECK(m >= 0.5 - kTolTight);
        CHECK(m < 2.0 + kTolTight);
      }
    }
  }
}
