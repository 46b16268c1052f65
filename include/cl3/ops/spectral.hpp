#pragma once
#include <array>
#include <cl3/core/cliffor.hpp>
#include <cl3/core/norm.hpp>
#include <cl3/ops/subalgebra.hpp>
#include <cmath>
#include <cstddef>
#include <string_view>
#include <utility>

namespace cl3::ops {

using core::Cliffor;
using core::Variant;

// ========================================================================
// 1. STATE MACHINE
// ========================================================================
// Every evaluation starts at `Reduced` and moves to exactly one of
// SubAlgebra / Colinear / Nilpotent / NeedsBoost; `NeedsBoost` continues to
// `Colinear` once. No state is revisited.

enum class SpectralState {
  Reduced,
  SubAlgebra, // closed form on R, I or C
  Colinear,   // eigen reconstruction through a projector pair
  Nilpotent,  // Jordan form f(eig) + f'(eig) * N
  NeedsBoost  // non-colinear BPV/APS, boosted to colinear first
};

constexpr std::string_view state_name(SpectralState s) {
  switch (s) {
  case SpectralState::Reduced:
    return "Reduced";
  case SpectralState::SubAlgebra:
    return "SubAlgebra";
  case SpectralState::Colinear:
    return "Colinear";
  case SpectralState::Nilpotent:
    return "Nilpotent";
  case SpectralState::NeedsBoost:
    return "NeedsBoost";
  }
  return "Unknown";
}

/// \brief Path taken by one `spectral_decompose` call.
struct SpectralTrace {
  static constexpr int kMaxSteps = 2;

  std::array<SpectralState, kMaxSteps + 1> path{};
  /// \brief Number of transitions out of `Reduced`.
  int steps = 0;

  void start() {
    path[0] = SpectralState::Reduced;
    steps = 0;
  }

  void advance(SpectralState next) {
    if (steps < kMaxSteps) {
      path[static_cast<size_t>(steps) + 1] = next;
    }
    ++steps;
  }

  SpectralState terminal() const {
    return path[static_cast<size_t>(steps < kMaxSteps ? steps : kMaxSteps)];
  }
};

// ========================================================================
// 2. PROJECTORS & PREDICATES
// ========================================================================

namespace detail {

// `0.5 * (1 + signum(dir))` for a vector direction.
inline Cliffor projector_along(const Cliffor &dir) {
  return core::R(0.5) + core::signum(core::to_v3(dir)) * 0.5;
}

// The bivector part read as a vector: -I * B.
inline Cliffor dual_vector(const Cliffor &x) { return core::mI * core::to_bv(x); }

inline bool has_both_parts(const Cliffor &v, const Cliffor &bv) {
  return core::largest_singular_value(v) != 0.0 && core::largest_singular_value(bv) != 0.0;
}

} // namespace detail

/**
 * \brief Idempotent projector `p` with `x = eig1 * p + eig2 * bar(p)` (colinear case).
 *
 * Scalar sub-algebras use the e3 projector `PV(0.5, 0, 0, 0.5)`.
 */
inline Cliffor project(const Cliffor &x) {
  const Cliffor r = core::reduce(x);
  switch (r.variant()) {
  case Variant::R:
  case Variant::I:
  case Variant::C:
    return core::PV(0.5, 0.0, 0.0, 0.5);
  case Variant::V3:
  case Variant::PV:
  case Variant::ODD:
    return detail::projector_along(core::to_v3(r));
  case Variant::BV:
  case Variant::H:
  case Variant::TPV:
    return detail::projector_along(detail::dual_vector(r));
  default: {
    // BPV and APS: the vector and dual bivector share a direction.
    const Cliffor v = core::to_v3(r);
    const Cliffor dir = v + detail::dual_vector(r);
    if (core::largest_singular_value(dir) <= core::kTol) {
      return detail::projector_along(v);
    }
    return detail::projector_along(dir);
  }
  }
}

/// \brief Vector and dual bivector parts are parallel or antiparallel.
inline bool is_colinear(const Cliffor &x) {
  const Cliffor v = core::to_v3(x);
  const Cliffor bv = detail::dual_vector(x);
  if (!detail::has_both_parts(v, bv)) {
    return false;
  }
  const Cliffor uu = core::signum(v) * core::signum(bv);
  return core::largest_singular_value(core::to_bv(uu)) <= core::kTol;
}

/// \brief Vector and dual bivector parts are orthogonal with equal magnitude.
inline bool has_nilpotent(const Cliffor &x) {
  const Cliffor v = core::to_v3(x);
  const Cliffor bv = detail::dual_vector(x);
  if (!detail::has_both_parts(v, bv)) {
    return false;
  }
  const Cliffor uu = core::signum(v) * core::signum(bv);
  const double mag_gap =
      core::largest_singular_value(v) - core::largest_singular_value(core::to_bv(x));
  return core::largest_singular_value(core::to_r(uu)) <= core::kTol &&
         std::abs(mag_gap) <= core::kTol;
}

/**
 * \brief First state the spectral engine moves to for `x`.
 *
 * Single-direction variants (V3, BV, PV, H, ODD, TPV) are colinear by
 * construction.
 */
inline SpectralState classify(const Cliffor &x) {
  const Cliffor r = core::reduce(x);
  switch (r.variant()) {
  case Variant::R:
  case Variant::I:
  case Variant::C:
    return SpectralState::SubAlgebra;
  case Variant::BPV:
  case Variant::APS:
    if (has_nilpotent(r))
      return SpectralState::Nilpotent;
    if (is_colinear(r))
      return SpectralState::Colinear;
    return SpectralState::NeedsBoost;
  default:
    return SpectralState::Colinear;
  }
}

// ========================================================================
// 3. EIGEN RECONSTRUCTION
// ========================================================================

/// \brief Eigenvalue pair, each an R, I or C cliffor.
using EigenPair = std::pair<Cliffor, Cliffor>;

/// \brief Sub-algebra projection used to read eigenvalues of a variant.
using EigenField = Cliffor (*)(const Cliffor &);

inline EigenField eigen_field(Variant v) {
  switch (v) {
  case Variant::V3:
  case Variant::PV:
    return &core::to_r;
  case Variant::BV:
  case Variant::TPV:
    return &core::to_i;
  default:
    return &core::to_c;
  }
}

/// \brief Eigenvalues `2 field(p x p)` and `2 field(bar(p) x bar(p))`.
inline EigenPair projector_eigs(const Cliffor &x, const Cliffor &p, EigenField field) {
  const Cliffor pb = core::bar(p);
  return {field(p * x * p) * 2.0, field(pb * x * pb) * 2.0};
}

/**
 * \brief Apply `f` through the projector pair of a colinear `x`.
 * \return `f(eig1) p + f(eig2) bar(p)`.
 */
template <typename Fn>
Cliffor decompose_special(Fn &&f, EigenField field, const Cliffor &x) {
  const Cliffor p = project(x);
  const Cliffor pb = core::bar(p);
  const auto [eig1, eig2] = projector_eigs(x, p, field);
  return f(eig1) * p + f(eig2) * pb;
}

/// \brief Jordan form `f(eig) + f'(eig) * to_bpv(x)` for nilpotent-like `x`.
template <typename Fn, typename FnPrime>
Cliffor jordan(Fn &&f, FnPrime &&f_prime, const Cliffor &x) {
  const Cliffor eig = x.variant() == Variant::APS ? core::to_c(x) : core::to_r(x);
  return f(eig) + f_prime(eig) * core::to_bpv(x);
}

/// \brief Result of boosting a general BPV/APS into colinear form.
struct BoostResult {
  Cliffor boost;
  /// \brief `bar(boost) * x * boost`, colinear.
  Cliffor colinear;
  Cliffor boost_bar;
};

/**
 * \brief Find a boost that aligns the vector and bivector parts of `x`.
 *
 * The boost is `exp(atanh(n) / 4)` for the invariant vector
 * `n = 2 (v x b) / (|v|^2 + |b|^2)`, evaluated through the real
 * eigen-decomposition of `n`.
 */
inline BoostResult boost_to_colinear(const Cliffor &x) {
  const Cliffor v = core::to_v3(x);
  const Cliffor bv = detail::dual_vector(x);
  const Cliffor num = core::mI * core::to_bv(v * bv) * 2.0;
  const Cliffor den = core::to_r(v * v + bv * bv);
  const Cliffor invariant = num * (1.0 / den.a0());

  const auto quarter_rapidity = [](const Cliffor &e) {
    return scalar::exp(scalar::atanh(e) * 0.25);
  };
  const Cliffor boost = decompose_special(quarter_rapidity, &core::to_r, invariant);
  const Cliffor boost_bar = core::bar(boost);
  return {boost, boost_bar * x * boost, boost_bar};
}

// ========================================================================
// 4. GENERIC SPECTRAL EVALUATION
// ========================================================================

/**
 * \brief Evaluate an analytic function on any cliffor.
 *
 * \param f Function on R / I / C cliffors.
 * \param f_prime Its derivative, used by the Jordan form.
 * \param x Argument; reduced before classification.
 * \param trace Optional out-parameter recording the states visited.
 */
template <typename Fn, typename FnPrime>
Cliffor spectral_decompose(Fn &&f, FnPrime &&f_prime, const Cliffor &x,
                           SpectralTrace *trace = nullptr) {
  SpectralTrace local;
  SpectralTrace &t = trace != nullptr ? *trace : local;
  t.start();

  const Cliffor r = core::reduce(x);
  const SpectralState state = classify(r);
  t.advance(state);

  switch (state) {
  case SpectralState::SubAlgebra:
    return f(r);
  case SpectralState::Nilpotent:
    return jordan(f, f_prime, r);
  case SpectralState::Colinear:
    return decompose_special(f, eigen_field(r.variant()), r);
  default:
    break;
  }

  const BoostResult b = boost_to_colinear(r);
  t.advance(SpectralState::Colinear);
  return b.boost * decompose_special(f, &core::to_c, b.colinear) * b.boost_bar;
}

/**
 * \brief Eigenvalue pair of `x`.
 *
 * Scalar sub-algebras give `(x, x)`; nilpotent BPV gives `(0, 0)` and
 * nilpotent APS gives its complex part twice.
 */
inline EigenPair eigvals(const Cliffor &x) {
  const Cliffor r = core::reduce(x);
  switch (classify(r)) {
  case SpectralState::SubAlgebra:
    return {r, r};
  case SpectralState::Nilpotent:
    if (r.variant() == Variant::APS)
      return {core::to_c(r), core::to_c(r)};
    return {core::R(0.0), core::R(0.0)};
  case SpectralState::Colinear: {
    const EigenField field = eigen_field(r.variant());
    return projector_eigs(r, project(r), field);
  }
  default: {
    const BoostResult b = boost_to_colinear(r);
    return projector_eigs(b.colinear, project(b.colinear), &core::to_c);
  }
  }
}

} // namespace cl3::ops
