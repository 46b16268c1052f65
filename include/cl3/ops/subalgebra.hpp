#pragma once
#include <cl3/core/cliffor.hpp>
#include <cmath>
#include <complex>
#include <numbers>

/// \file
/// \brief Closed-form functions on the commutative sub-algebras R, I and C.
///
/// `I` and `C` are isomorphic to the imaginary axis and to the complex plane,
/// so every function is the real or complex analytic function restricted to
/// the input's variant. Values leaving the real line (log of a negative, asin
/// outside [-1, 1], ...) continue into `C` on the principal branch of
/// `std::complex`. Inputs outside the sub-algebras are read through `to_c`.

namespace cl3::ops::scalar {

using core::Cliffor;
using core::Variant;
using Complex = std::complex<double>;

inline Complex to_complex(const Cliffor &x) { return {x.a0(), x.a123()}; }

inline Cliffor from_complex(const Complex &z) { return core::C(z.real(), z.imag()); }

inline Cliffor recip(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(1.0 / x.a0());
  case Variant::I: {
    const double t = x.a123();
    return core::I(-t / (t * t));
  }
  default: {
    const double d = x.a0() * x.a0() + x.a123() * x.a123();
    return core::C(x.a0() / d, -x.a123() / d);
  }
  }
}

inline Cliffor exp(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::exp(x.a0()));
  case Variant::I:
    return core::C(std::cos(x.a123()), std::sin(x.a123()));
  default:
    return from_complex(std::exp(to_complex(x)));
  }
}

inline Cliffor log(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    if (x.a0() < 0.0)
      return core::C(std::log(-x.a0()), std::numbers::pi);
    return core::R(std::log(x.a0()));
  case Variant::I: {
    // log(I(0)) carries no phase.
    const double t = x.a123();
    const double phase = t == 0.0 ? 0.0 : std::copysign(std::numbers::pi / 2, t);
    return core::C(std::log(std::abs(t)), phase);
  }
  default:
    return from_complex(std::log(to_complex(x)));
  }
}

inline Cliffor sqrt(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    if (x.a0() < 0.0)
      return core::I(std::sqrt(-x.a0()));
    return core::R(std::sqrt(x.a0()));
  default:
    return from_complex(std::sqrt(to_complex(x)));
  }
}

inline Cliffor sin(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::sin(x.a0()));
  case Variant::I:
    return core::I(std::sinh(x.a123()));
  default:
    return from_complex(std::sin(to_complex(x)));
  }
}

inline Cliffor cos(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::cos(x.a0()));
  case Variant::I:
    return core::R(std::cosh(x.a123()));
  default:
    return from_complex(std::cos(to_complex(x)));
  }
}

inline Cliffor tan(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::tan(x.a0()));
  case Variant::I:
    return core::I(std::tanh(x.a123()));
  default:
    return from_complex(std::tan(to_complex(x)));
  }
}

inline Cliffor asin(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    if (std::abs(x.a0()) <= 1.0)
      return core::R(std::asin(x.a0()));
    return from_complex(std::asin(Complex(x.a0(), 0.0)));
  case Variant::I:
    return core::I(std::asinh(x.a123()));
  default:
    return from_complex(std::asin(to_complex(x)));
  }
}

inline Cliffor acos(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    if (std::abs(x.a0()) <= 1.0)
      return core::R(std::acos(x.a0()));
    return from_complex(std::acos(Complex(x.a0(), 0.0)));
  case Variant::I:
    return core::C(std::numbers::pi / 2, -std::asinh(x.a123()));
  default:
    return from_complex(std::acos(to_complex(x)));
  }
}

inline Cliffor atan(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::atan(x.a0()));
  case Variant::I:
    // i*atanh(t) inside the unit interval, off the cut.
    if (std::abs(x.a123()) < 1.0)
      return core::I(std::atanh(x.a123()));
    return from_complex(std::atan(Complex(0.0, x.a123())));
  default:
    return from_complex(std::atan(to_complex(x)));
  }
}

inline Cliffor sinh(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::sinh(x.a0()));
  case Variant::I:
    return core::I(std::sin(x.a123()));
  default:
    return from_complex(std::sinh(to_complex(x)));
  }
}

inline Cliffor cosh(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::cosh(x.a0()));
  case Variant::I:
    return core::R(std::cos(x.a123()));
  default:
    return from_complex(std::cosh(to_complex(x)));
  }
}

inline Cliffor tanh(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::tanh(x.a0()));
  case Variant::I:
    return core::I(std::tan(x.a123()));
  default:
    return from_complex(std::tanh(to_complex(x)));
  }
}

inline Cliffor asinh(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return core::R(std::asinh(x.a0()));
  case Variant::I:
    if (std::abs(x.a123()) <= 1.0)
      return core::I(std::asin(x.a123()));
    return from_complex(std::asinh(Complex(0.0, x.a123())));
  default:
    return from_complex(std::asinh(to_complex(x)));
  }
}

inline Cliffor acosh(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    if (x.a0() >= 1.0)
      return core::R(std::acosh(x.a0()));
    return from_complex(std::acosh(Complex(x.a0(), 0.0)));
  default:
    return from_complex(std::acosh(to_complex(x)));
  }
}

inline Cliffor atanh(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    if (std::abs(x.a0()) <= 1.0)
      return core::R(std::atanh(x.a0()));
    // (log(1 + x) - log(1 - x)) / 2 with log of a negative real at phase +pi.
    return core::C(0.5 * std::log(std::abs((1.0 + x.a0()) / (1.0 - x.a0()))),
                   -std::copysign(std::numbers::pi / 2, x.a0()));
  case Variant::I:
    return core::I(std::atan(x.a123()));
  default:
    return from_complex(std::atanh(to_complex(x)));
  }
}

} // namespace cl3::ops::scalar
