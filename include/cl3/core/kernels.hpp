#pragma once
#include <array>
#include <bit>
#include <cl3/core/grades.hpp>
#include <cstddef>

namespace cl3::core {

using Coefficients = std::array<double, kComponents>;

// ========================================================================
// 1. BLADE BITMAPS & SIGNS
// ========================================================================
// Canonical blades are bitmaps over (e1, e2, e3): e1 = 1, e2 = 2, e12 = 3,
// e3 = 4, e13 = 5, e23 = 6, e123 = 7. The cliffor layout stores e31 rather
// than e13, so slot a31 maps to bitmap 5 with a negative sign.

struct SlotBlade {
  unsigned int bitmap;
  int sign;
};

inline constexpr std::array<SlotBlade, kComponents> kSlotBlades = {{
    {0, 1}, // a0
    {1, 1}, // a1
    {2, 1}, // a2
    {4, 1}, // a3
    {6, 1}, // a23
    {5, -1}, // a31 = -e13
    {3, 1}, // a12
    {7, 1}, // a123
}};

constexpr std::size_t slot_of_bitmap(unsigned int bitmap) {
  for (std::size_t i = 0; i < kComponents; ++i) {
    if (kSlotBlades[i].bitmap == bitmap)
      return i;
  }
  return 0;
}

// Computes the sign for basis blade multiplication a * b in Cl(3,0).
// All generators square to +1, so only the reordering parity matters.
constexpr int geometric_product_sign(unsigned int a, unsigned int b) {
  unsigned int a_temp = a >> 1;
  int swaps = 0;
  while (a_temp != 0) {
    swaps += std::popcount(a_temp & b);
    a_temp >>= 1;
  }
  return (swaps % 2) != 0 ? -1 : 1;
}

// Slot-level Cayley table: slot_i * slot_j = sign * slot_(target).
struct CayleyTable {
  std::array<int, kComponents * kComponents> signs{};
  std::array<std::size_t, kComponents * kComponents> targets{};

  consteval CayleyTable() {
    for (std::size_t i = 0; i < kComponents; ++i) {
      for (std::size_t j = 0; j < kComponents; ++j) {
        const SlotBlade a = kSlotBlades[i];
        const SlotBlade b = kSlotBlades[j];
        const unsigned int bitmap = a.bitmap ^ b.bitmap;
        const std::size_t target = slot_of_bitmap(bitmap);
        signs[i * kComponents + j] = a.sign * b.sign *
                                     geometric_product_sign(a.bitmap, b.bitmap) *
                                     kSlotBlades[target].sign;
        targets[i * kComponents + j] = target;
      }
    }
  }

  constexpr int sign(std::size_t i, std::size_t j) const {
    return signs[i * kComponents + j];
  }
  constexpr std::size_t target(std::size_t i, std::size_t j) const {
    return targets[i * kComponents + j];
  }
};

inline constexpr CayleyTable kCayley{};

static_assert(kCayley.target(kA1, kA2) == kA12 && kCayley.sign(kA1, kA2) == 1);
static_assert(kCayley.target(kA3, kA1) == kA31 && kCayley.sign(kA3, kA1) == 1);
static_assert(kCayley.target(kA123, kA123) == kA0 && kCayley.sign(kA123, kA123) == -1);

// ========================================================================
// 2. PRODUCT KERNELS
// ========================================================================

struct ProductKernels {
  // =========================================================
  // IMPLEMENTATION A: NAIVE (Runtime Loop with Table)
  // =========================================================
  // Reference product over the full embedding. Kept for cross-checking the
  // grade-block kernel.
  static constexpr Coefficients multiply_naive(const Coefficients &a,
                                               const Coefficients &b) {
    Coefficients out{};
    for (std::size_t i = 0; i < kComponents; ++i) {
      for (std::size_t j = 0; j < kComponents; ++j) {
        const std::size_t k = kCayley.target(i, j);
        if (kCayley.sign(i, j) > 0)
          out[k] += a[i] * b[j];
        else
          out[k] -= a[i] * b[j];
      }
    }
    return out;
  }

  // =========================================================
  // IMPLEMENTATION B: GRADE BLOCKS (Hand-unrolled)
  // =========================================================
  // Each block multiplies the grade-GA part of `a` by the grade-GB part of
  // `b`. The bivector is handled as I times its dual vector, so
  //   u v       = u.v + I (u x v)
  //   u (I b)   = -(u x b) + I (u.b)
  //   (I a)(I b) = -(a.b) - I (a x b)
  template <int GA, int GB>
  static constexpr void block(Coefficients &r, const Coefficients &a,
                              const Coefficients &b) {
    if constexpr (GA == 0) {
      // Scalar on the left scales every component of the block.
      if constexpr (GB == 0) {
        r[kA0] += a[kA0] * b[kA0];
      } else if constexpr (GB == 1) {
        r[kA1] += a[kA0] * b[kA1];
        r[kA2] += a[kA0] * b[kA2];
        r[kA3] += a[kA0] * b[kA3];
      } else if constexpr (GB == 2) {
        r[kA23] += a[kA0] * b[kA23];
        r[kA31] += a[kA0] * b[kA31];
        r[kA12] += a[kA0] * b[kA12];
      } else {
        r[kA123] += a[kA0] * b[kA123];
      }
    } else if constexpr (GB == 0) {
      if constexpr (GA == 1) {
        r[kA1] += a[kA1] * b[kA0];
        r[kA2] += a[kA2] * b[kA0];
        r[kA3] += a[kA3] * b[kA0];
      } else if constexpr (GA == 2) {
        r[kA23] += a[kA23] * b[kA0];
        r[kA31] += a[kA31] * b[kA0];
        r[kA12] += a[kA12] * b[kA0];
      } else {
        r[kA123] += a[kA123] * b[kA0];
      }
    } else if constexpr (GA == 1 && GB == 1) {
      r[kA0] += a[kA1] * b[kA1] + a[kA2] * b[kA2] + a[kA3] * b[kA3];
      r[kA23] += a[kA2] * b[kA3] - a[kA3] * b[kA2];
      r[kA31] += a[kA3] * b[kA1] - a[kA1] * b[kA3];
      r[kA12] += a[kA1] * b[kA2] - a[kA2] * b[kA1];
    } else if constexpr (GA == 1 && GB == 2) {
      r[kA1] += a[kA3] * b[kA31] - a[kA2] * b[kA12];
      r[kA2] += a[kA1] * b[kA12] - a[kA3] * b[kA23];
      r[kA3] += a[kA2] * b[kA23] - a[kA1] * b[kA31];
      r[kA123] += a[kA1] * b[kA23] + a[kA2] * b[kA31] + a[kA3] * b[kA12];
    } else if constexpr (GA == 2 && GB == 1) {
      r[kA1] += a[kA12] * b[kA2] - a[kA31] * b[kA3];
      r[kA2] += a[kA23] * b[kA3] - a[kA12] * b[kA1];
      r[kA3] += a[kA31] * b[kA1] - a[kA23] * b[kA2];
      r[kA123] += a[kA23] * b[kA1] + a[kA31] * b[kA2] + a[kA12] * b[kA3];
    } else if constexpr (GA == 1 && GB == 3) {
      r[kA23] += a[kA1] * b[kA123];
      r[kA31] += a[kA2] * b[kA123];
      r[kA12] += a[kA3] * b[kA123];
    } else if constexpr (GA == 3 && GB == 1) {
      r[kA23] += a[kA123] * b[kA1];
      r[kA31] += a[kA123] * b[kA2];
      r[kA12] += a[kA123] * b[kA3];
    } else if constexpr (GA == 2 && GB == 2) {
      r[kA0] -= a[kA23] * b[kA23] + a[kA31] * b[kA31] + a[kA12] * b[kA12];
      r[kA23] += a[kA12] * b[kA31] - a[kA31] * b[kA12];
      r[kA31] += a[kA23] * b[kA12] - a[kA12] * b[kA23];
      r[kA12] += a[kA31] * b[kA23] - a[kA23] * b[kA31];
    } else if constexpr (GA == 2 && GB == 3) {
      r[kA1] -= a[kA23] * b[kA123];
      r[kA2] -= a[kA31] * b[kA123];
      r[kA3] -= a[kA12] * b[kA123];
    } else if constexpr (GA == 3 && GB == 2) {
      r[kA1] -= a[kA123] * b[kA23];
      r[kA2] -= a[kA123] * b[kA31];
      r[kA3] -= a[kA123] * b[kA12];
    } else {
      r[kA0] -= a[kA123] * b[kA123];
    }
  }

  template <int GA>
  static constexpr void row(Coefficients &r, const Coefficients &a,
                            const Coefficients &b, GradeMask mb) {
    if (mb & kGrade0)
      block<GA, 0>(r, a, b);
    if (mb & kGrade1)
      block<GA, 1>(r, a, b);
    if (mb & kGrade2)
      block<GA, 2>(r, a, b);
    if (mb & kGrade3)
      block<GA, 3>(r, a, b);
  }

  /**
   * \brief Geometric product restricted to the grades present in each operand.
   * \param a Left operand embedding.
   * \param ma Grades carried by `a`.
   * \param b Right operand embedding.
   * \param mb Grades carried by `b`.
   * \return Full embedding of `a * b`.
   */
  static constexpr Coefficients geometric_product(const Coefficients &a,
                                                  GradeMask ma,
                                                  const Coefficients &b,
                                                  GradeMask mb) {
    Coefficients r{};
    if (ma & kGrade0)
      row<0>(r, a, b, mb);
    if (ma & kGrade1)
      row<1>(r, a, b, mb);
    if (ma & kGrade2)
      row<2>(r, a, b, mb);
    if (ma & kGrade3)
      row<3>(r, a, b, mb);
    return r;
  }
};

} // namespace cl3::core
