#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <limits>

#include <cl3/core/cliffor.hpp>
#include <cl3/io/format.hpp>
#include <cl3/random.hpp>

#include "support/generators.hpp"

using namespace cl3::core;

TEST_CASE("Factories fill only their own fields") {
  const Cliffor x = APS(1, 2, 3, 4, 5, 6, 7, 8);
  CHECK(x.a0() == 1);
  CHECK(x.a1() == 2);
  CHECK(x.a2() == 3);
  CHECK(x.a3() == 4);
  CHECK(x.a23() == 5);
  CHECK(x.a31() == 6);
  CHECK(x.a12() == 7);
  CHECK(x.a123() == 8);

  const Cliffor odd = ODD(1, 2, 3, 4);
  CHECK(odd.variant() == Variant::ODD);
  CHECK(odd == APS(0, 1, 2, 3, 0, 0, 0, 4));

  CHECK(TPV(1, 2, 3, 4) == APS(0, 0, 0, 0, 1, 2, 3, 4));
  CHECK(BPV(1, 2, 3, 4, 5, 6) == APS(0, 1, 2, 3, 4, 5, 6, 0));
  CHECK(H(1, 2, 3, 4) == APS(1, 0, 0, 0, 2, 3, 4, 0));
  CHECK(C(1, 2) == APS(1, 0, 0, 0, 0, 0, 0, 2));
}

TEST_CASE("from_embedding zeroes components outside the support") {
  const Coefficients full = {1, 2, 3, 4, 5, 6, 7, 8};
  const Cliffor h = Cliffor::from_embedding(Variant::H, full);
  CHECK(h == H(1, 5, 6, 7));
  CHECK(h.a1() == 0.0);
  CHECK(h.a123() == 0.0);
}

TEST_CASE("Projections") {
  auto gen = cl3::test_support::make_engine(3);
  const Cliffor x = cl3::sampling::random_aps(0.5, 2.0, gen);

  SUBCASE("Each projection keeps exactly its grades") {
    CHECK(to_r(x) == R(x.a0()));
    CHECK(to_v3(x) == V3(x.a1(), x.a2(), x.a3()));
    CHECK(to_bv(x) == BV(x.a23(), x.a31(), x.a12()));
    CHECK(to_i(x) == I(x.a123()));
    CHECK(to_c(x) == C(x.a0(), x.a123()));
    CHECK(to_bpv(x).variant() == Variant::BPV);
    CHECK(to_aps(x) == x);
  }

  SUBCASE("Projection is idempotent for every target") {
    for (Variant target : kAllVariants) {
      for (Variant source : kAllVariants) {
        const Cliffor v = cl3::sampling::random_of(source, 0.5, 2.0, gen);
        const Cliffor once = project(target, v);
        CHECK(once.variant() == target);
        CHECK(project(target, once) == once);
        if (contains(target, source)) {
          CHECK(once == v);
        }
      }
    }
  }

  SUBCASE("Grades split and recombine") {
    CHECK(to_c(x) + to_bpv(x) == x);
    CHECK(to_pv(x) + to_tpv(x) == x);
    CHECK(to_h(x) + to_odd(x) == x);
  }
}

TEST_CASE("Equality is structural over the embedding") {
  CHECK(R(0) == I(0));
  CHECK(R(0) == APS(0, 0, 0, 0, 0, 0, 0, 0));
  CHECK(V3(1, 2, 3) == PV(0, 1, 2, 3));
  CHECK(PV(0, 1, 2, 3) == V3(1, 2, 3));
  CHECK(V3(1, 2, 3) != BV(1, 2, 3));
  CHECK(R(1) != R(-1));
  CHECK(R(0.0) == R(-0.0));

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const Cliffor bad = V3(nan, 0, 0);
  CHECK_FALSE(bad == bad);
  CHECK(bad != V3(0, 0, 0));

  auto gen = cl3::test_support::make_engine(5);
  for (Variant a : kAllVariants) {
    const Cliffor x = cl3::sampling::random_of(a, 0.5, 2.0, gen);
    CHECK(x == x);
    CHECK(x == to_aps(x));
    CHECK(to_aps(x) == x);
  }
}

TEST_CASE("Conjugations") {
  const Cliffor x = APS(1, 2, 3, 4, 5, 6, 7, 8);

  CHECK(bar(x) == APS(1, -2, -3, -4, -5, -6, -7, 8));
  CHECK(dag(x) == APS(1, 2, 3, 4, -5, -6, -7, -8));
  CHECK(bar(bar(x)) == x);
  CHECK(dag(dag(x)) == x);
  CHECK(bar(V3(1, 2, 3)).variant() == Variant::V3);
  CHECK(dag(C(1, 2)) == C(1, -2));
  CHECK(bar(C(1, 2)) == C(1, 2));

  auto gen = cl3::test_support::make_engine(9);
  for (Variant a : kAllVariants) {
    const Cliffor y = cl3::sampling::random_of(a, 0.5, 2.0, gen);
    CHECK(bar(bar(y)) == y);
    CHECK(dag(dag(y)) == y);
    CHECK(bar(y).variant() == a);
    CHECK(dag(y).variant() == a);
  }
}

TEST_CASE("Negation, subtraction and scaling keep the variant") {
  const Cliffor h = H(1, 2, 3, 4);
  CHECK((-h).variant() == Variant::H);
  CHECK(-h == H(-1, -2, -3, -4));
  CHECK(h - h == R(0));
  CHECK((h - h).variant() == Variant::H);
  CHECK(h * 2.0 == H(2, 4, 6, 8));
  CHECK(2.0 * h == h * 2.0);
  CHECK(h / 2.0 == H(0.5, 1, 1.5, 2));
  CHECK((V3(1, 0, 0) + 1.0) == PV(1, 1, 0, 0));
  CHECK((1.0 - V3(1, 0, 0)) == PV(1, -1, 0, 0));

  // Fields outside the support stay +0.0 under negation.
  const Cliffor neg = -V3(1, 2, 3);
  CHECK_FALSE(std::signbit(neg.a0()));
  CHECK_FALSE(std::signbit(neg.a123()));
}

TEST_CASE("Vector views") {
  const Cliffor x = BPV(1, 2, 3, 4, 5, 6);
  CHECK(x.vector_part().x == 1);
  CHECK(x.vector_part().z == 3);
  CHECK(x.bivector_dual().x == 4);
  CHECK(x.bivector_dual().z == 6);
  CHECK(V3(Vec3{1, 2, 3}) == V3(1, 2, 3));
}
