#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <cl3/cl3.hpp>

using namespace cl3;

// ==================================================================================
// SAMPLE OUTPUT
// ==================================================================================

static void print_basics() {
  const Cliffor e1 = core::V3(1, 0, 0);
  const Cliffor e2 = core::V3(0, 1, 0);

  fmt::print("e1 * e2            = {}\n", e1 * e2);
  fmt::print("abs(V3(3, 4, 0))   = {}\n", core::abs(core::V3(3, 4, 0)));
  fmt::print("exp(I(pi))         = {}\n", core::reduce(ops::exp(core::I(3.14159265358979))));
  fmt::print("log(R(-1))         = {}\n", ops::log(core::R(-1)));
  fmt::print("sqrt(R(-4))        = {}\n", ops::sqrt(core::R(-4)));
  fmt::print("octave(BV(1,2,3))  = {}\n", io::show_octave(core::BV(1, 2, 3)));
}

static void print_spectral(const Cliffor &x) {
  ops::SpectralTrace trace;
  const Cliffor y = ops::spectral_decompose(ops::exp, ops::exp_prime, x, &trace);
  const auto [eig1, eig2] = ops::eigvals(x);

  fmt::print("x      = {}\n", x);
  fmt::print("path   =");
  for (int i = 0; i <= trace.steps && i <= ops::SpectralTrace::kMaxSteps; ++i) {
    fmt::print(" {}", ops::state_name(trace.path[static_cast<size_t>(i)]));
  }
  fmt::print("\n");
  fmt::print("eigs   = {}, {}\n", eig1, eig2);
  fmt::print("exp(x) = {}\n", core::reduce(y));
  fmt::print("check  = {}\n", core::reduce(ops::log(y) - x));
}

int main(int argc, char **argv) {
  const std::uint64_t seed = core::seed_from_env().value_or(42);
  const int count = argc > 1 ? std::atoi(argv[1]) : 1024;
  if (count <= 0) {
    fmt::print(stderr, "usage: {} [count > 0]\n", argv[0]);
    return 1;
  }

  std::mt19937_64 gen(seed);
  core::log_line("Demo", "seed={} count={}", seed, count);

  print_basics();

  fmt::print("\n-- colinear --\n");
  print_spectral(core::BPV(1, 2, 3, 2, 4, 6));
  fmt::print("\n-- nilpotent --\n");
  print_spectral(core::R(0.5) + sampling::random_nilpotent(gen));
  fmt::print("\n-- boosted --\n");
  print_spectral(sampling::random_bpv(0.2, 1.0, gen));

  // Bulk evaluation over a packed buffer.
  std::vector<Cliffor> values;
  values.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    values.push_back(sampling::random_cliffor(0.1, 1.0, gen));
  }
  const io::PackedBuffer in = io::PackedBuffer::pack(values);
  io::PackedBuffer out(in.size());
  ops::map_packed(in.raw(), out.raw(), ops::exp);

  double worst = 0.0;
  for (size_t i = 0; i < out.size(); ++i) {
    const Cliffor residual = ops::log(out.at(i)) - values[i];
    worst = std::max(worst, core::largest_singular_value(core::reduce(residual)));
  }
  fmt::print("\nbulk exp over {} values, max |log(exp(x)) - x| = {:.3e}\n", count, worst);

  return 0;
}
