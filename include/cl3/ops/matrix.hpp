#pragma once
#include <Eigen/Core>
#include <cl3/core/cliffor.hpp>
#include <complex>

namespace cl3::ops {

using Matrix2c = Eigen::Matrix2cd;

/**
 * \brief Image of `x` under the isomorphism Cl(3,0) -> M(2,C).
 *
 * Basis: e0 = [1,0;0,1], e1 = [0,1;1,0], e2 = [0,-i;i,0], e3 = [1,0;0,-1].
 * With s = a0 + i a123 and w = v + i b (b the dual of the bivector),
 *   M = [ s + w3, w1 - i w2 ; w1 + i w2, s - w3 ].
 */
inline Matrix2c to_matrix(const core::Cliffor &x) {
  using Complex = std::complex<double>;
  const Complex i(0.0, 1.0);
  const Complex s(x.a0(), x.a123());
  const Complex w1(x.a1(), x.a23());
  const Complex w2(x.a2(), x.a31());
  const Complex w3(x.a3(), x.a12());

  Matrix2c m;
  m(0, 0) = s + w3;
  m(0, 1) = w1 - i * w2;
  m(1, 0) = w1 + i * w2;
  m(1, 1) = s - w3;
  return m;
}

/// \brief Inverse of `to_matrix`; always an `APS`.
inline core::Cliffor from_matrix(const Matrix2c &m) {
  using Complex = std::complex<double>;
  const Complex i(0.0, 1.0);
  const Complex s = (m(0, 0) + m(1, 1)) * 0.5;
  const Complex w3 = (m(0, 0) - m(1, 1)) * 0.5;
  const Complex w1 = (m(1, 0) + m(0, 1)) * 0.5;
  const Complex w2 = (m(1, 0) - m(0, 1)) * 0.5 / i;
  return core::APS(s.real(), w1.real(), w2.real(), w3.real(), w1.imag(), w2.imag(),
                   w3.imag(), s.imag());
}

} // namespace cl3::ops
