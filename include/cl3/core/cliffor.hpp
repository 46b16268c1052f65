#pragma once
#include <array>
#include <cl3/core/grades.hpp>
#include <cl3/core/kernels.hpp>
#include <cl3/core/vec3.hpp>
#include <cstddef>
#include <xsimd/xsimd.hpp>

namespace cl3::core {

// ========================================================================
// 1. THE CLIFFOR VALUE
// ========================================================================

/**
 * \brief A value of Cl(3,0): a variant tag plus the full 8-component embedding.
 *
 * Components outside the tag's grade support are always `+0.0`, so two
 * cliffors of different variants can be compared field by field.
 */
class Cliffor {
public:
  /// \brief The zero cliffor, `R(0)`.
  constexpr Cliffor() : variant_(Variant::R), data_{} {}

  /**
   * \brief Build a cliffor of variant `v` from a full embedding.
   *
   * Components outside the support of `v` are discarded.
   */
  static constexpr Cliffor from_embedding(Variant v, const Coefficients &c) {
    Cliffor out;
    out.variant_ = v;
    const std::uint8_t mask = component_mask(v);
    for (std::size_t i = 0; i < kComponents; ++i) {
      out.data_[i] = ((mask >> i) & 1u) ? c[i] : 0.0;
    }
    return out;
  }

  constexpr Variant variant() const { return variant_; }
  constexpr GradeMask grades() const { return grade_mask(variant_); }

  constexpr double operator[](std::size_t i) const { return data_[i]; }
  constexpr const Coefficients &data() const { return data_; }

  constexpr double a0() const { return data_[kA0]; }
  constexpr double a1() const { return data_[kA1]; }
  constexpr double a2() const { return data_[kA2]; }
  constexpr double a3() const { return data_[kA3]; }
  constexpr double a23() const { return data_[kA23]; }
  constexpr double a31() const { return data_[kA31]; }
  constexpr double a12() const { return data_[kA12]; }
  constexpr double a123() const { return data_[kA123]; }

  /// \brief Grade-1 part as a plain vector.
  constexpr Vec3 vector_part() const { return {data_[kA1], data_[kA2], data_[kA3]}; }

  /// \brief Grade-2 part read as its dual vector `-I * B` = (a23, a31, a12).
  constexpr Vec3 bivector_dual() const {
    return {data_[kA23], data_[kA31], data_[kA12]};
  }

  // --- EQUALITY ---

  // Structural over the full embedding; missing fields are zero.
  constexpr bool operator==(const Cliffor &other) const {
    for (std::size_t i = 0; i < kComponents; ++i) {
      if (!(data_[i] == other.data_[i]))
        return false;
    }
    return true;
  }

  // --- ARITHMETIC OPERATORS ---

  constexpr Cliffor operator-() const {
    Cliffor res = *this;
    const std::uint8_t mask = component_mask(variant_);
    for (std::size_t i = 0; i < kComponents; ++i) {
      if ((mask >> i) & 1u)
        res.data_[i] = -data_[i];
    }
    return res;
  }

  constexpr Cliffor operator+(const Cliffor &other) const {
    Coefficients sum{};
    for (std::size_t i = 0; i < kComponents; ++i)
      sum[i] = data_[i] + other.data_[i];
    return from_embedding(sum_variant(variant_, other.variant_), sum);
  }

  constexpr Cliffor operator-(const Cliffor &other) const { return *this + (-other); }

  constexpr Cliffor operator*(const Cliffor &other) const {
    const Coefficients prod = ProductKernels::geometric_product(
        data_, grades(), other.data_, other.grades());
    return from_embedding(product_variant(variant_, other.variant_), prod);
  }

  // Scaling keeps the variant.
  constexpr Cliffor operator*(double s) const {
    Cliffor res = *this;
    const std::uint8_t mask = component_mask(variant_);
    for (std::size_t i = 0; i < kComponents; ++i) {
      if ((mask >> i) & 1u)
        res.data_[i] = data_[i] * s;
    }
    return res;
  }

  constexpr Cliffor operator/(double s) const {
    Cliffor res = *this;
    const std::uint8_t mask = component_mask(variant_);
    for (std::size_t i = 0; i < kComponents; ++i) {
      if ((mask >> i) & 1u)
        res.data_[i] = data_[i] / s;
    }
    return res;
  }

  constexpr Cliffor &operator+=(const Cliffor &other) { return *this = *this + other; }
  constexpr Cliffor &operator-=(const Cliffor &other) { return *this = *this - other; }
  constexpr Cliffor &operator*=(const Cliffor &other) { return *this = *this * other; }
  constexpr Cliffor &operator*=(double s) { return *this = *this * s; }

private:
  Variant variant_;
  alignas(xsimd::default_arch::alignment()) Coefficients data_;
};

// ========================================================================
// 2. GRADE FACTORIES
// ========================================================================

constexpr Cliffor R(double a0) {
  return Cliffor::from_embedding(Variant::R, {a0, 0, 0, 0, 0, 0, 0, 0});
}
constexpr Cliffor V3(double a1, double a2, double a3) {
  return Cliffor::from_embedding(Variant::V3, {0, a1, a2, a3, 0, 0, 0, 0});
}
constexpr Cliffor V3(const Vec3 &v) { return V3(v.x, v.y, v.z); }
constexpr Cliffor BV(double a23, double a31, double a12) {
  return Cliffor::from_embedding(Variant::BV, {0, 0, 0, 0, a23, a31, a12, 0});
}
constexpr Cliffor I(double a123) {
  return Cliffor::from_embedding(Variant::I, {0, 0, 0, 0, 0, 0, 0, a123});
}
constexpr Cliffor PV(double a0, double a1, double a2, double a3) {
  return Cliffor::from_embedding(Variant::PV, {a0, a1, a2, a3, 0, 0, 0, 0});
}
constexpr Cliffor H(double a0, double a23, double a31, double a12) {
  return Cliffor::from_embedding(Variant::H, {a0, 0, 0, 0, a23, a31, a12, 0});
}
constexpr Cliffor C(double a0, double a123) {
  return Cliffor::from_embedding(Variant::C, {a0, 0, 0, 0, 0, 0, 0, a123});
}
constexpr Cliffor BPV(double a1, double a2, double a3, double a23, double a31,
                      double a12) {
  return Cliffor::from_embedding(Variant::BPV, {0, a1, a2, a3, a23, a31, a12, 0});
}
constexpr Cliffor ODD(double a1, double a2, double a3, double a123) {
  return Cliffor::from_embedding(Variant::ODD, {0, a1, a2, a3, 0, 0, 0, a123});
}
constexpr Cliffor TPV(double a23, double a31, double a12, double a123) {
  return Cliffor::from_embedding(Variant::TPV, {0, 0, 0, 0, a23, a31, a12, a123});
}
constexpr Cliffor APS(double a0, double a1, double a2, double a3, double a23,
                      double a31, double a12, double a123) {
  return Cliffor::from_embedding(Variant::APS, {a0, a1, a2, a3, a23, a31, a12, a123});
}

/// \brief Negative unit pseudo-scalar; `mI * B` maps a bivector to its dual vector.
inline constexpr Cliffor mI = I(-1.0);

// ========================================================================
// 3. SCALAR MIXING
// ========================================================================

constexpr Cliffor operator*(double s, const Cliffor &x) { return x * s; }
constexpr Cliffor operator+(const Cliffor &x, double s) { return x + R(s); }
constexpr Cliffor operator+(double s, const Cliffor &x) { return R(s) + x; }
constexpr Cliffor operator-(const Cliffor &x, double s) { return x - R(s); }
constexpr Cliffor operator-(double s, const Cliffor &x) { return R(s) - x; }

// ========================================================================
// 4. PROJECTIONS & CONJUGATIONS
// ========================================================================

/**
 * \brief Project `x` onto variant `v`.
 *
 * Grades outside `v` are dropped; grades of `v` absent from `x` read as zero.
 */
constexpr Cliffor project(Variant v, const Cliffor &x) {
  return Cliffor::from_embedding(v, x.data());
}

constexpr Cliffor to_r(const Cliffor &x) { return project(Variant::R, x); }
constexpr Cliffor to_v3(const Cliffor &x) { return project(Variant::V3, x); }
constexpr Cliffor to_bv(const Cliffor &x) { return project(Variant::BV, x); }
constexpr Cliffor to_i(const Cliffor &x) { return project(Variant::I, x); }
constexpr Cliffor to_pv(const Cliffor &x) { return project(Variant::PV, x); }
constexpr Cliffor to_h(const Cliffor &x) { return project(Variant::H, x); }
constexpr Cliffor to_c(const Cliffor &x) { return project(Variant::C, x); }
constexpr Cliffor to_bpv(const Cliffor &x) { return project(Variant::BPV, x); }
constexpr Cliffor to_odd(const Cliffor &x) { return project(Variant::ODD, x); }
constexpr Cliffor to_tpv(const Cliffor &x) { return project(Variant::TPV, x); }
constexpr Cliffor to_aps(const Cliffor &x) { return project(Variant::APS, x); }

namespace detail {
constexpr Cliffor negate_grades(const Cliffor &x, GradeMask negated) {
  Coefficients c = x.data();
  const std::uint8_t mask = component_mask(x.variant());
  for (std::size_t i = 0; i < kComponents; ++i) {
    if (((mask >> i) & 1u) && ((negated >> component_grade(i)) & 1u))
      c[i] = -c[i];
  }
  return Cliffor::from_embedding(x.variant(), c);
}
} // namespace detail

/// \brief Clifford conjugate: negates the vector and bivector grades.
constexpr Cliffor bar(const Cliffor &x) {
  return detail::negate_grades(x, kGrade1 | kGrade2);
}

/// \brief Complex conjugate (reversion): negates the bivector and trivector grades.
constexpr Cliffor dag(const Cliffor &x) {
  return detail::negate_grades(x, kGrade2 | kGrade3);
}

static_assert(V3(1, 0, 0) * V3(0, 1, 0) == H(0, 0, 0, 1));
static_assert(mI * BV(1, 2, 3) == V3(1, 2, 3));
static_assert((V3(1, 2, 3) + BV(0, 0, 1)).variant() == Variant::BPV);

} // namespace cl3::core
