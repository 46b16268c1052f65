#pragma once
#include <algorithm>
#include <cl3/core/cliffor.hpp>
#include <cl3/core/grades.hpp>
#include <cl3/core/norm.hpp>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <random>

/// \file
/// \brief Random cliffors for tests and demos.
///
/// Every generator advances the caller's engine in place, so a fixed seed
/// reproduces the same sequence. Magnitudes are drawn from `[|lo|, |hi|)`;
/// scalars get a random sign and vectors a uniform spherical direction.

namespace cl3::sampling {

using core::Cliffor;

namespace detail {

template <std::uniform_random_bit_generator Gen>
double magnitude(double lo, double hi, Gen &gen) {
  const double a = std::min(std::abs(lo), std::abs(hi));
  const double b = std::max(std::abs(lo), std::abs(hi));
  return std::uniform_real_distribution<double>(a, b)(gen);
}

template <std::uniform_random_bit_generator Gen> double signed_magnitude(double lo, double hi, Gen &gen) {
  const double mag = magnitude(lo, hi, gen);
  return std::bernoulli_distribution(0.5)(gen) ? mag : -mag;
}

// (sin t cos p, sin t sin p, cos t) with t in [0, pi], p in [0, 2 pi].
template <std::uniform_random_bit_generator Gen> core::Vec3 direction(Gen &gen) {
  const double theta = std::uniform_real_distribution<double>(0.0, std::numbers::pi)(gen);
  const double phi = std::uniform_real_distribution<double>(0.0, 2.0 * std::numbers::pi)(gen);
  return {std::sin(theta) * std::cos(phi), std::sin(theta) * std::sin(phi), std::cos(theta)};
}

} // namespace detail

// ========================================================================
// 1. SINGLE GRADES
// ========================================================================

template <std::uniform_random_bit_generator Gen>
Cliffor random_r(double lo, double hi, Gen &gen) {
  return core::R(detail::signed_magnitude(lo, hi, gen));
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_i(double lo, double hi, Gen &gen) {
  return core::I(detail::signed_magnitude(lo, hi, gen));
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_v3(double lo, double hi, Gen &gen) {
  const double mag = detail::magnitude(lo, hi, gen);
  return core::V3(detail::direction(gen) * mag);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_bv(double lo, double hi, Gen &gen) {
  const double mag = detail::magnitude(lo, hi, gen);
  const core::Vec3 d = detail::direction(gen) * mag;
  return core::BV(d.x, d.y, d.z);
}

// ========================================================================
// 2. MIXED GRADES
// ========================================================================
// Built as sums of independent single-grade samples, drawn in grade order.

template <std::uniform_random_bit_generator Gen>
Cliffor random_pv(double lo, double hi, Gen &gen) {
  const Cliffor r = random_r(lo, hi, gen);
  return r + random_v3(lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_h(double lo, double hi, Gen &gen) {
  const Cliffor r = random_r(lo, hi, gen);
  return r + random_bv(lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_c(double lo, double hi, Gen &gen) {
  const Cliffor r = random_r(lo, hi, gen);
  return r + random_i(lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_bpv(double lo, double hi, Gen &gen) {
  const Cliffor v = random_v3(lo, hi, gen);
  return v + random_bv(lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_odd(double lo, double hi, Gen &gen) {
  const Cliffor v = random_v3(lo, hi, gen);
  return v + random_i(lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_tpv(double lo, double hi, Gen &gen) {
  const Cliffor bv = random_bv(lo, hi, gen);
  return bv + random_i(lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen>
Cliffor random_aps(double lo, double hi, Gen &gen) {
  const Cliffor pv = random_pv(lo, hi, gen);
  return pv + random_tpv(lo, hi, gen);
}

/// \brief Random value of variant `v`.
template <std::uniform_random_bit_generator Gen>
Cliffor random_of(core::Variant v, double lo, double hi, Gen &gen) {
  using core::Variant;
  switch (v) {
  case Variant::R:
    return random_r(lo, hi, gen);
  case Variant::V3:
    return random_v3(lo, hi, gen);
  case Variant::BV:
    return random_bv(lo, hi, gen);
  case Variant::I:
    return random_i(lo, hi, gen);
  case Variant::PV:
    return random_pv(lo, hi, gen);
  case Variant::H:
    return random_h(lo, hi, gen);
  case Variant::C:
    return random_c(lo, hi, gen);
  case Variant::BPV:
    return random_bpv(lo, hi, gen);
  case Variant::ODD:
    return random_odd(lo, hi, gen);
  case Variant::TPV:
    return random_tpv(lo, hi, gen);
  case Variant::APS:
    return random_aps(lo, hi, gen);
  }
  return random_aps(lo, hi, gen);
}

/// \brief One of the 11 variants chosen uniformly, then sampled in `[|lo|, |hi|)`.
template <std::uniform_random_bit_generator Gen>
Cliffor random_cliffor(double lo, double hi, Gen &gen) {
  std::uniform_int_distribution<std::size_t> pick(0, core::kVariantCount - 1);
  return random_of(core::kAllVariants[pick(gen)], lo, hi, gen);
}

template <std::uniform_random_bit_generator Gen> Cliffor random_cliffor(Gen &gen) {
  return random_cliffor(0.0, 1.0, gen);
}

// ========================================================================
// 3. STRUCTURED SAMPLES
// ========================================================================

template <std::uniform_random_bit_generator Gen> Cliffor random_unit_v3(Gen &gen) {
  return core::V3(detail::direction(gen));
}

/// \brief Projector `0.5 + 0.5 u` along a random unit vector `u`.
template <std::uniform_random_bit_generator Gen> Cliffor random_projector(Gen &gen) {
  return 0.5 + random_unit_v3(gen) * 0.5;
}

/// \brief Nilpotent BPV `n * p` with `n` a unit vector normal to projector `p`.
template <std::uniform_random_bit_generator Gen> Cliffor random_nilpotent(Gen &gen) {
  const Cliffor p = random_projector(gen);
  const Cliffor v = random_unit_v3(gen);
  const Cliffor normal = core::signum(core::mI * core::to_bv(core::to_v3(p) * v));
  return core::to_bpv(normal * p);
}

} // namespace cl3::sampling
