#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <cl3/core/cliffor.hpp>
#include <cl3/io/format.hpp>

using namespace cl3::core;
using cl3::io::parse_cliffor;
using cl3::io::show_octave;

TEST_CASE("fmt prints the variant and its own fields") {
  CHECK(fmt::format("{}", H(0, 0, 0, 1)) == "H(0, 0, 0, 1)");
  CHECK(fmt::format("{}", R(2)) == "R(2)");
  CHECK(fmt::format("{}", C(1.5, -2)) == "C(1.5, -2)");
  CHECK(fmt::format("{}", V3(1, 2, 3)) == "V3(1, 2, 3)");
  CHECK(fmt::format("{}", APS(1, 2, 3, 4, 5, 6, 7, 8)) == "APS(1, 2, 3, 4, 5, 6, 7, 8)");
}

TEST_CASE("operator<< matches fmt") {
  std::ostringstream os;
  os << BPV(1, 2, 3, 4, 5, 6);
  CHECK(os.str() == "BPV(1, 2, 3, 4, 5, 6)");
}

TEST_CASE("Octave rendering in the Pauli basis") {
  CHECK(show_octave(R(2)) == "2*e0");
  CHECK(show_octave(BV(1, 2, 3)) == "1i*e1 + 2i*e2 + 3i*e3");
  CHECK(show_octave(PV(1, 2, 3, 4)) == "1*e0 + 2*e1 + 3*e2 + 4*e3");
  CHECK(show_octave(C(1, -1)) == "1*e0 + -1i*e0");
  CHECK(show_octave(ODD(1, 0, 0, 2)) == "1*e1 + 0*e2 + 0*e3 + 2i*e0");
}

TEST_CASE("Formatted text parses back to the same value") {
  const Cliffor values[] = {R(-0.25), I(3), H(0.1, 0.2, 0.3, 1e-300), C(1.5, -2),
                            BPV(1, 2, 3, 4, 5, 6), APS(1, 2, 3, 4, 5, 6, 7, 8)};
  for (const Cliffor &x : values) {
    const Cliffor back = parse_cliffor(fmt::format("{}", x));
    CHECK(back.variant() == x.variant());
    CHECK(back == x);
  }

  CHECK(parse_cliffor("  ODD( 1,2 , 3,4 ) ") == ODD(1, 2, 3, 4));
  CHECK(parse_cliffor("TPV(0, 0, 0, 1)").variant() == Variant::TPV);

  const double inf = std::numeric_limits<double>::infinity();
  const Cliffor special = parse_cliffor(fmt::format("{}", V3(inf, -1, 0)));
  CHECK(std::isinf(special.a1()));
  CHECK(std::isnan(parse_cliffor("R(nan)").a0()));
}

TEST_CASE("Malformed text is rejected") {
  CHECK_THROWS_AS(parse_cliffor(""), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("Q(1)"), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("R 1"), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("R()"), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("R(1, 2)"), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("V3(1, 2)"), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("V3(1, x, 3)"), std::invalid_argument);
  CHECK_THROWS_AS(parse_cliffor("R(1,)"), std::invalid_argument);
}
