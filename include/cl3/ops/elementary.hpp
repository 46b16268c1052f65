#pragma once
#include <cl3/core/cliffor.hpp>
#include <cl3/core/norm.hpp>
#include <cl3/ops/spectral.hpp>
#include <cl3/ops/subalgebra.hpp>

/// \file
/// \brief Reciprocal and the elementary transcendental functions on Cl(3,0).
///
/// R, I and C inputs take the closed forms in `subalgebra.hpp`; every other
/// variant goes through `spectral_decompose` with the function itself and
/// its derivative, and the result is reduced to its sparsest variant.

namespace cl3::ops {

// ========================================================================
// 1. DECLARATIONS
// ========================================================================

inline Cliffor recip(const Cliffor &x);
inline Cliffor exp(const Cliffor &x);
inline Cliffor log(const Cliffor &x);
inline Cliffor sqrt(const Cliffor &x);
inline Cliffor sin(const Cliffor &x);
inline Cliffor cos(const Cliffor &x);
inline Cliffor tan(const Cliffor &x);
inline Cliffor asin(const Cliffor &x);
inline Cliffor acos(const Cliffor &x);
inline Cliffor atan(const Cliffor &x);
inline Cliffor sinh(const Cliffor &x);
inline Cliffor cosh(const Cliffor &x);
inline Cliffor tanh(const Cliffor &x);
inline Cliffor asinh(const Cliffor &x);
inline Cliffor acosh(const Cliffor &x);
inline Cliffor atanh(const Cliffor &x);

// ========================================================================
// 2. DERIVATIVES
// ========================================================================
// Used by the Jordan form on nilpotent-like arguments.

inline Cliffor recip_prime(const Cliffor &x) { return -recip(x * x); }
inline Cliffor exp_prime(const Cliffor &x) { return exp(x); }
inline Cliffor log_prime(const Cliffor &x) { return recip(x); }
inline Cliffor sqrt_prime(const Cliffor &x) { return recip(sqrt(x)) * 0.5; }
inline Cliffor sin_prime(const Cliffor &x) { return cos(x); }
inline Cliffor cos_prime(const Cliffor &x) { return -sin(x); }
inline Cliffor tan_prime(const Cliffor &x) {
  const Cliffor sec = recip(cos(x));
  return sec * sec;
}
inline Cliffor asin_prime(const Cliffor &x) { return recip(sqrt(1.0 - x * x)); }
inline Cliffor acos_prime(const Cliffor &x) { return -recip(sqrt(1.0 - x * x)); }
inline Cliffor atan_prime(const Cliffor &x) { return recip(1.0 + x * x); }
inline Cliffor sinh_prime(const Cliffor &x) { return cosh(x); }
inline Cliffor cosh_prime(const Cliffor &x) { return sinh(x); }
inline Cliffor tanh_prime(const Cliffor &x) {
  const Cliffor sech = recip(cosh(x));
  return sech * sech;
}
inline Cliffor asinh_prime(const Cliffor &x) { return recip(sqrt(x * x + 1.0)); }
inline Cliffor acosh_prime(const Cliffor &x) {
  return recip(sqrt(x - 1.0) * sqrt(x + 1.0));
}
inline Cliffor atanh_prime(const Cliffor &x) { return recip(1.0 - x * x); }

// ========================================================================
// 3. RECIPROCAL
// ========================================================================

/**
 * \brief Multiplicative inverse.
 *
 * Zero-norm arguments produce IEEE Inf/NaN components.
 */
inline Cliffor recip(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
  case Variant::I:
  case Variant::C:
    return scalar::recip(x);
  case Variant::V3:
    return x * (1.0 / x.vector_part().norm_sq());
  case Variant::BV:
    return -x * (1.0 / x.bivector_dual().norm_sq());
  case Variant::H: {
    const double n = x.a0() * x.a0() + x.bivector_dual().norm_sq();
    return core::bar(x) * (1.0 / n);
  }
  case Variant::ODD: {
    const double n = x.vector_part().norm_sq() + x.a123() * x.a123();
    return core::ODD(x.a1() / n, x.a2() / n, x.a3() / n, -x.a123() / n);
  }
  case Variant::PV:
  case Variant::TPV: {
    // x * bar(x) is a real scalar for these variants.
    const Cliffor xb = core::bar(x);
    return scalar::recip(core::to_r(x * xb)) * xb;
  }
  default:
    return core::reduce(spectral_decompose(recip, recip_prime, x));
  }
}

// ========================================================================
// 4. TRANSCENDENTAL FUNCTIONS
// ========================================================================

/// \brief Exponential; `exp(I(pi))` is `R(-1)` up to rounding.
inline Cliffor exp(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::exp(x);
  return core::reduce(spectral_decompose(exp, exp_prime, x));
}

/// \brief Principal logarithm; negative reals continue to `C(log|x|, pi)`.
inline Cliffor log(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::log(x);
  return core::reduce(spectral_decompose(log, log_prime, x));
}

/// \brief Principal square root.
inline Cliffor sqrt(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::sqrt(x);
  return core::reduce(spectral_decompose(sqrt, sqrt_prime, x));
}

inline Cliffor sin(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::sin(x);
  return core::reduce(spectral_decompose(sin, sin_prime, x));
}

inline Cliffor cos(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::cos(x);
  return core::reduce(spectral_decompose(cos, cos_prime, x));
}

inline Cliffor tan(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::tan(x);
  return core::reduce(spectral_decompose(tan, tan_prime, x));
}

inline Cliffor asin(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::asin(x);
  return core::reduce(spectral_decompose(asin, asin_prime, x));
}

inline Cliffor acos(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::acos(x);
  return core::reduce(spectral_decompose(acos, acos_prime, x));
}

inline Cliffor atan(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::atan(x);
  return core::reduce(spectral_decompose(atan, atan_prime, x));
}

inline Cliffor sinh(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::sinh(x);
  return core::reduce(spectral_decompose(sinh, sinh_prime, x));
}

inline Cliffor cosh(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::cosh(x);
  return core::reduce(spectral_decompose(cosh, cosh_prime, x));
}

inline Cliffor tanh(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::tanh(x);
  return core::reduce(spectral_decompose(tanh, tanh_prime, x));
}

inline Cliffor asinh(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::asinh(x);
  return core::reduce(spectral_decompose(asinh, asinh_prime, x));
}

inline Cliffor acosh(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::acosh(x);
  return core::reduce(spectral_decompose(acosh, acosh_prime, x));
}

inline Cliffor atanh(const Cliffor &x) {
  if (core::is_scalar_subalgebra(x.variant()))
    return scalar::atanh(x);
  return core::reduce(spectral_decompose(atanh, atanh_prime, x));
}

} // namespace cl3::ops

namespace cl3::core {

// ========================================================================
// 5. DIVISION
// ========================================================================

/// \brief Right division `a * recip(b)`.
inline Cliffor operator/(const Cliffor &a, const Cliffor &b) { return a * ops::recip(b); }

inline Cliffor operator/(double a, const Cliffor &b) { return ops::recip(b) * a; }

inline Cliffor &operator/=(Cliffor &a, const Cliffor &b) { return a = a / b; }

} // namespace cl3::core
