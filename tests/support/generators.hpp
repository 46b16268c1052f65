#pragma once

#include <cstdint>
#include <random>

#include <cl3/core/cliffor.hpp>
#include <cl3/random.hpp>

namespace cl3::test_support {

using cl3::core::Cliffor;
using Engine = std::mt19937_64;

inline Engine make_engine(std::uint64_t seed = 42) { return Engine(seed); }

/// \brief APS whose vector and dual bivector share the direction `u`.
inline Cliffor random_colinear_aps(Engine &gen) {
  std::uniform_real_distribution<double> coef(-2.0, 2.0);
  const Cliffor u = cl3::sampling::random_unit_v3(gen);
  const double a0 = coef(gen);
  const double sv = coef(gen);
  const double sb = coef(gen);
  const double a123 = coef(gen);
  return cl3::core::APS(a0, sv * u.a1(), sv * u.a2(), sv * u.a3(), sb * u.a1(), sb * u.a2(),
                        sb * u.a3(), a123);
}

/// \brief Complex scalar plus a scaled nilpotent BPV.
inline Cliffor random_nilpotent_aps(Engine &gen) {
  std::uniform_real_distribution<double> coef(-2.0, 2.0);
  const Cliffor n = cl3::sampling::random_nilpotent(gen) * 2.0;
  return cl3::core::C(coef(gen), coef(gen)) + n;
}

} // namespace cl3::test_support
