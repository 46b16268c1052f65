#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cl3::core {

// ========================================================================
// 1. VARIANTS & GRADE MASKS
// ========================================================================
// Cl(3,0) has four grades. A variant is identified by the set of grades it
// can hold, stored as a 4-bit mask (bit g <=> grade g).

using GradeMask = std::uint8_t;

inline constexpr GradeMask kGrade0 = 1u << 0;
inline constexpr GradeMask kGrade1 = 1u << 1;
inline constexpr GradeMask kGrade2 = 1u << 2;
inline constexpr GradeMask kGrade3 = 1u << 3;

/// \brief The eleven specialized representations of a cliffor.
enum class Variant : std::uint8_t {
  R,   // G0: real scalar
  V3,  // G1: vector
  BV,  // G2: bivector
  I,   // G3: imaginary pseudo-scalar
  PV,  // G0 + G1: paravector
  H,   // G0 + G2: quaternion (even sub-algebra)
  C,   // G0 + G3: complex (center of the algebra)
  BPV, // G1 + G2: biparavector
  ODD, // G1 + G3: odd part
  TPV, // G2 + G3: triparavector
  APS  // G0 + G1 + G2 + G3
};

inline constexpr std::size_t kVariantCount = 11;

inline constexpr std::array<Variant, kVariantCount> kAllVariants = {
    Variant::R,  Variant::V3,  Variant::BV,  Variant::I,
    Variant::PV, Variant::H,   Variant::C,   Variant::BPV,
    Variant::ODD, Variant::TPV, Variant::APS};

constexpr std::size_t index_of(Variant v) { return static_cast<std::size_t>(v); }

constexpr GradeMask grade_mask(Variant v) {
  switch (v) {
  case Variant::R:
    return kGrade0;
  case Variant::V3:
    return kGrade1;
  case Variant::BV:
    return kGrade2;
  case Variant::I:
    return kGrade3;
  case Variant::PV:
    return kGrade0 | kGrade1;
  case Variant::H:
    return kGrade0 | kGrade2;
  case Variant::C:
    return kGrade0 | kGrade3;
  case Variant::BPV:
    return kGrade1 | kGrade2;
  case Variant::ODD:
    return kGrade1 | kGrade3;
  case Variant::TPV:
    return kGrade2 | kGrade3;
  case Variant::APS:
    return kGrade0 | kGrade1 | kGrade2 | kGrade3;
  }
  return kGrade0 | kGrade1 | kGrade2 | kGrade3;
}

constexpr std::string_view variant_name(Variant v) {
  constexpr std::array<std::string_view, kVariantCount> names = {
      "R", "V3", "BV", "I", "PV", "H", "C", "BPV", "ODD", "TPV", "APS"};
  return names[index_of(v)];
}

/**
 * \brief Sparsest variant whose support contains every grade of `mask`.
 *
 * An empty mask maps to `R` (the zero cliffor is written `R(0)`). Any mask
 * mixing grades {0,1,2} or spanning three or more grades needs `APS`.
 */
constexpr Variant minimal_variant(GradeMask mask) {
  constexpr std::array<Variant, 16> table = {
      Variant::R,   // 0000
      Variant::R,   // 0001
      Variant::V3,  // 0010
      Variant::PV,  // 0011
      Variant::BV,  // 0100
      Variant::H,   // 0101
      Variant::BPV, // 0110
      Variant::APS, // 0111
      Variant::I,   // 1000
      Variant::C,   // 1001
      Variant::ODD, // 1010
      Variant::APS, // 1011
      Variant::TPV, // 1100
      Variant::APS, // 1101
      Variant::APS, // 1110
      Variant::APS  // 1111
  };
  return table[mask & 0x0Fu];
}

constexpr bool contains(Variant outer, Variant inner) {
  return (grade_mask(inner) & ~grade_mask(outer)) == 0;
}

/// \brief `R`, `I` and `C` are commutative sub-algebras with closed-form functions.
constexpr bool is_scalar_subalgebra(Variant v) {
  return v == Variant::R || v == Variant::I || v == Variant::C;
}

// ========================================================================
// 2. COMPONENT LAYOUT
// ========================================================================
// Full embedding order, shared with the packed binary layout:
//   [a0, a1, a2, a3, a23, a31, a12, a123]

inline constexpr std::size_t kComponents = 8;

enum Component : std::size_t {
  kA0 = 0,
  kA1 = 1,
  kA2 = 2,
  kA3 = 3,
  kA23 = 4,
  kA31 = 5,
  kA12 = 6,
  kA123 = 7
};

constexpr int component_grade(std::size_t i) {
  constexpr std::array<int, kComponents> grades = {0, 1, 1, 1, 2, 2, 2, 3};
  return grades[i];
}

/// \brief Bitmask over the 8 components that belong to variant `v`.
constexpr std::uint8_t component_mask(Variant v) {
  const GradeMask g = grade_mask(v);
  std::uint8_t mask = 0;
  for (std::size_t i = 0; i < kComponents; ++i) {
    if ((g >> component_grade(i)) & 1u) {
      mask |= static_cast<std::uint8_t>(1u << i);
    }
  }
  return mask;
}

constexpr bool in_support(Variant v, std::size_t component) {
  return (component_mask(v) >> component) & 1u;
}

// ========================================================================
// 3. PRODUCT GRADE TABLE
// ========================================================================
// Grades produced by the geometric product of a grade-ga and a grade-gb
// blade in Cl(3,0):
//   0*k = k, 1*1 = {0,2}, 1*2 = {1,3}, 1*3 = {2}, 2*2 = {0,2}, 2*3 = {1},
//   3*3 = {0}

constexpr GradeMask grade_product(int ga, int gb) {
  if (ga == 0) {
    return static_cast<GradeMask>(1u << gb);
  }
  if (gb == 0) {
    return static_cast<GradeMask>(1u << ga);
  }
  if (ga > gb) {
    const int t = ga;
    ga = gb;
    gb = t;
  }
  if (ga == 1 && gb == 1)
    return kGrade0 | kGrade2;
  if (ga == 1 && gb == 2)
    return kGrade1 | kGrade3;
  if (ga == 1 && gb == 3)
    return kGrade2;
  if (ga == 2 && gb == 2)
    return kGrade0 | kGrade2;
  if (ga == 2 && gb == 3)
    return kGrade1;
  return kGrade0; // 3*3
}

constexpr GradeMask product_grades(GradeMask a, GradeMask b) {
  GradeMask out = 0;
  for (int ga = 0; ga < 4; ++ga) {
    if (((a >> ga) & 1u) == 0)
      continue;
    for (int gb = 0; gb < 4; ++gb) {
      if (((b >> gb) & 1u) == 0)
        continue;
      out |= grade_product(ga, gb);
    }
  }
  return out;
}

/**
 * \brief Dense result-variant tables for the 11 x 11 variant pairs.
 *
 * Built once at compile time; lookups avoid any runtime grade analysis.
 */
struct VariantTables {
  std::array<Variant, kVariantCount * kVariantCount> sum{};
  std::array<Variant, kVariantCount * kVariantCount> product{};

  consteval VariantTables() {
    for (Variant a : kAllVariants) {
      for (Variant b : kAllVariants) {
        const std::size_t k = index_of(a) * kVariantCount + index_of(b);
        sum[k] = minimal_variant(grade_mask(a) | grade_mask(b));
        product[k] = minimal_variant(product_grades(grade_mask(a), grade_mask(b)));
      }
    }
  }
};

inline constexpr VariantTables kVariantTables{};

constexpr Variant sum_variant(Variant a, Variant b) {
  return kVariantTables.sum[index_of(a) * kVariantCount + index_of(b)];
}

constexpr Variant product_variant(Variant a, Variant b) {
  return kVariantTables.product[index_of(a) * kVariantCount + index_of(b)];
}

static_assert(product_variant(Variant::V3, Variant::V3) == Variant::H);
static_assert(product_variant(Variant::V3, Variant::BV) == Variant::ODD);
static_assert(product_variant(Variant::I, Variant::PV) == Variant::TPV);
static_assert(product_variant(Variant::TPV, Variant::I) == Variant::PV);
static_assert(product_variant(Variant::PV, Variant::PV) == Variant::APS);
static_assert(sum_variant(Variant::V3, Variant::H) == Variant::APS);
static_assert(std::popcount(component_mask(Variant::BPV)) == 6);

} // namespace cl3::core
