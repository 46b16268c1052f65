#pragma once
#include <cl3/core/cliffor.hpp>
#include <cmath>
#include <compare>

namespace cl3::core {

/// \brief Absolute tolerance used by `reduce` and the classification predicates.
inline constexpr double kTol = 128 * 1.1102230246251565e-16;

/// \brief `kTol` as a cliffor, for comparisons against norms.
inline constexpr Cliffor tol = R(kTol);

// ========================================================================
// 1. SINGULAR VALUES
// ========================================================================
// Under the M(2,C) isomorphism the two singular values of x are
//   sqrt(|x|^2 +- 2 sqrt(|a0 v + a123 b|^2 + |v x b|^2))
// where v is the vector part and b the dual of the bivector part. Variants
// that lack the mixed terms reduce to a plain Euclidean norm.

namespace detail {

inline double sum_of_squares(const Cliffor &x) {
  double s = 0.0;
  for (std::size_t i = 0; i < kComponents; ++i)
    s += x[i] * x[i];
  return s;
}

// Cross term sqrt(|a0 v + a123 b|^2 + |v x b|^2), restricted to the grade
// blocks the variant actually carries.
inline double cross_term(const Cliffor &x) {
  const Vec3 v = x.vector_part();
  const Vec3 b = x.bivector_dual();
  switch (x.variant()) {
  case Variant::PV:
    return std::abs(x.a0()) * v.norm();
  case Variant::TPV:
    return std::abs(x.a123()) * b.norm();
  case Variant::BPV:
    return v.cross(b).norm();
  case Variant::APS: {
    const Vec3 w = v * x.a0() + b * x.a123();
    return std::sqrt(w.norm_sq() + v.cross(b).norm_sq());
  }
  default:
    return 0.0;
  }
}

} // namespace detail

/// \brief Largest singular value (the magnitude used for ordering).
inline double largest_singular_value(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
    return std::abs(x.a0());
  case Variant::I:
    return std::abs(x.a123());
  case Variant::V3:
    return x.vector_part().norm();
  case Variant::BV:
    return x.bivector_dual().norm();
  default:
    return std::sqrt(detail::sum_of_squares(x) + 2.0 * detail::cross_term(x));
  }
}

/// \brief Smallest singular value; zero for nilpotent-like elements.
inline double smallest_singular_value(const Cliffor &x) {
  switch (x.variant()) {
  case Variant::R:
  case Variant::I:
  case Variant::V3:
  case Variant::BV:
    return largest_singular_value(x);
  default: {
    // Rounding can push the radicand slightly below zero.
    const double d = detail::sum_of_squares(x) - 2.0 * detail::cross_term(x);
    return std::sqrt(d < 0.0 ? 0.0 : d);
  }
  }
}

/// \brief Largest singular value as an `R` cliffor.
inline Cliffor abs(const Cliffor &x) { return R(largest_singular_value(x)); }

/// \brief Smallest singular value as an `R` cliffor.
inline Cliffor lsv(const Cliffor &x) { return R(smallest_singular_value(x)); }

/**
 * \brief Unit-magnitude element in the direction of `x`.
 *
 * Keeps the variant. An exactly zero magnitude yields `R(0)`.
 */
inline Cliffor signum(const Cliffor &x) {
  const double mag = largest_singular_value(x);
  if (mag == 0.0) {
    return R(0.0);
  }
  return x * (1.0 / mag);
}

// ========================================================================
// 2. ORDERING
// ========================================================================

/**
 * \brief Total preorder by (largest, smallest) singular value.
 *
 * Does not refine equality: unitary multiples compare equivalent.
 * NaN magnitudes compare unordered.
 */
inline std::partial_ordering compare(const Cliffor &a, const Cliffor &b) {
  const std::partial_ordering primary =
      largest_singular_value(a) <=> largest_singular_value(b);
  if (primary != 0) {
    return primary;
  }
  return smallest_singular_value(a) <=> smallest_singular_value(b);
}

inline std::partial_ordering operator<=>(const Cliffor &a, const Cliffor &b) {
  return compare(a, b);
}

// ========================================================================
// 3. REDUCTION
// ========================================================================

namespace detail {

inline bool negligible(const Cliffor &x) { return largest_singular_value(x) <= kTol; }

} // namespace detail

/**
 * \brief Drop grade blocks whose magnitude is within `kTol` of zero.
 *
 * The result is the sparsest variant that still carries the remaining
 * content, and is itself reduced: `reduce(reduce(x)) == reduce(x)`.
 */
inline Cliffor reduce(const Cliffor &x) {
  if (x.variant() == Variant::R) {
    return x;
  }
  if (detail::negligible(x)) {
    return R(0.0);
  }

  // Two-grade variants: keep whichever half survives.
  const auto split = [&x](Variant lo, Variant hi) -> Cliffor {
    if (detail::negligible(project(lo, x)))
      return reduce(project(hi, x));
    if (detail::negligible(project(hi, x)))
      return reduce(project(lo, x));
    return x;
  };

  switch (x.variant()) {
  case Variant::V3:
  case Variant::BV:
  case Variant::I:
    return x;
  case Variant::PV:
    return split(Variant::R, Variant::V3);
  case Variant::H:
    return split(Variant::R, Variant::BV);
  case Variant::C:
    return split(Variant::R, Variant::I);
  case Variant::BPV:
    return split(Variant::V3, Variant::BV);
  case Variant::ODD:
    return split(Variant::V3, Variant::I);
  case Variant::TPV:
    return split(Variant::BV, Variant::I);
  default:
    break;
  }

  // APS: peel off complementary pairs of sub-algebras.
  if (detail::negligible(to_c(x)))
    return reduce(to_bpv(x));
  if (detail::negligible(to_bpv(x)))
    return reduce(to_c(x));
  if (detail::negligible(to_h(x)))
    return reduce(to_odd(x));
  if (detail::negligible(to_odd(x)))
    return reduce(to_h(x));
  if (detail::negligible(to_pv(x)))
    return reduce(to_tpv(x));
  if (detail::negligible(to_tpv(x)))
    return reduce(to_pv(x));
  return x;
}

} // namespace cl3::core
