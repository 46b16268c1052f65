#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <complex>

#include <Eigen/Eigenvalues>
#include <Eigen/SVD>

#include <cl3/core/cliffor.hpp>
#include <cl3/core/norm.hpp>
#include <cl3/ops/matrix.hpp>
#include <cl3/ops/spectral.hpp>
#include <cl3/random.hpp>

#include "support/cliffor_approx.hpp"
#include "support/generators.hpp"
#include "support/tolerances.hpp"

using namespace cl3::core;
using cl3::ops::Matrix2c;
using cl3::ops::from_matrix;
using cl3::ops::to_matrix;
using cl3::test_support::approx;
using cl3::test_support::kTolMedium;

namespace {

std::complex<double> as_complex(const Cliffor &x) { return {x.a0(), x.a123()}; }

} // namespace

TEST_CASE("Pauli basis") {
  const std::complex<double> i(0.0, 1.0);

  const Matrix2c s1 = to_matrix(V3(1, 0, 0));
  CHECK(s1(0, 1) == std::complex<double>(1, 0));
  CHECK(s1(1, 0) == std::complex<double>(1, 0));
  CHECK(s1(0, 0) == std::complex<double>(0, 0));

  const Matrix2c s2 = to_matrix(V3(0, 1, 0));
  CHECK(s2(0, 1) == -i);
  CHECK(s2(1, 0) == i);

  const Matrix2c s3 = to_matrix(V3(0, 0, 1));
  CHECK(s3(0, 0) == std::complex<double>(1, 0));
  CHECK(s3(1, 1) == std::complex<double>(-1, 0));

  // The pseudoscalar is i times the identity.
  const Matrix2c pi = to_matrix(I(1));
  CHECK(pi(0, 0) == i);
  CHECK(pi(1, 1) == i);
  CHECK(pi(0, 1) == std::complex<double>(0, 0));
}

TEST_CASE("to_matrix is an algebra isomorphism") {
  auto gen = cl3::test_support::make_engine(51);

  for (Variant a : kAllVariants) {
    for (Variant b : kAllVariants) {
      const Cliffor x = cl3::sampling::random_of(a, 0.5, 2.0, gen);
      const Cliffor y = cl3::sampling::random_of(b, 0.5, 2.0, gen);

      const Matrix2c product = to_matrix(x) * to_matrix(y);
      CHECK((to_matrix(x * y) - product).norm() == doctest::Approx(0.0).epsilon(kTolMedium));
      CHECK((to_matrix(x + y) - to_matrix(x) - to_matrix(y)).norm() ==
            doctest::Approx(0.0).epsilon(kTolMedium));
    }

    const Cliffor x = cl3::sampling::random_of(a, 0.5, 2.0, gen);
    CHECK(from_matrix(to_matrix(x)) == approx(x, cl3::test_support::kTolTight));
    CHECK(from_matrix(to_matrix(x)).variant() == Variant::APS);
  }
}

TEST_CASE("Singular values agree with Eigen's SVD") {
  auto gen = cl3::test_support::make_engine(52);

  for (int trial = 0; trial < 50; ++trial) {
    const Cliffor x = cl3::sampling::random_cliffor(0.1, 3.0, gen);
    CAPTURE(x);

    Eigen::JacobiSVD<Matrix2c> svd(to_matrix(x));
    const auto sv = svd.singularValues();
    CHECK(largest_singular_value(x) == doctest::Approx(sv(0)).epsilon(1e-9));
    CHECK(smallest_singular_value(x) + 1.0 == doctest::Approx(sv(1) + 1.0).epsilon(1e-7));
  }
}

TEST_CASE("eigvals agree with the matrix spectrum") {
  auto gen = cl3::test_support::make_engine(53);

  for (int trial = 0; trial < 30; ++trial) {
    const Cliffor x = cl3::sampling::random_aps(0.5, 2.0, gen);
    CAPTURE(x);

    Eigen::ComplexEigenSolver<Matrix2c> solver(to_matrix(x));
    const auto ev = solver.eigenvalues();
    const auto [e1, e2] = cl3::ops::eigvals(x);

    const std::complex<double> trace = as_complex(e1) + as_complex(e2);
    const std::complex<double> det = as_complex(e1) * as_complex(e2);
    CHECK(std::abs(trace - (ev(0) + ev(1))) < 1e-6);
    CHECK(std::abs(det - ev(0) * ev(1)) < 1e-6);
  }
}
