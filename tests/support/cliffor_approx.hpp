#pragma once

#include <cmath>
#include <ostream>

#include <cl3/core/cliffor.hpp>
#include <cl3/io/format.hpp>

#include "tolerances.hpp"

namespace cl3::test_support {

using cl3::core::Cliffor;

/// \brief Largest absolute component difference over the full embedding.
inline double max_component_diff(const Cliffor &a, const Cliffor &b) {
  double worst = 0.0;
  for (std::size_t i = 0; i < cl3::core::kComponents; ++i) {
    const double d = std::abs(a[i] - b[i]);
    if (!(d <= worst)) {
      worst = d; // also picks up NaN
    }
  }
  return worst;
}

// Component-wise tolerance wrapper, used as `CHECK(x == approx(y))`.
struct ApproxCliffor {
  Cliffor value;
  double eps;
};

inline ApproxCliffor approx(const Cliffor &value, double eps = kTolLoose) {
  return {value, eps};
}

inline bool operator==(const Cliffor &lhs, const ApproxCliffor &rhs) {
  return max_component_diff(lhs, rhs.value) <= rhs.eps;
}

inline std::ostream &operator<<(std::ostream &os, const ApproxCliffor &a) {
  return os << "approx(" << a.value << ", eps=" << a.eps << ")";
}

} // namespace cl3::test_support
