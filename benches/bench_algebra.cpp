#include <benchmark/benchmark.h>

#include <cstdint>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

#include <cl3/core/cliffor.hpp>
#include <cl3/core/kernels.hpp>
#include <cl3/core/norm.hpp>
#include <cl3/io/storage.hpp>
#include <cl3/ops/bulk.hpp>
#include <cl3/ops/elementary.hpp>
#include <cl3/random.hpp>

using cl3::core::Cliffor;
using cl3::core::Variant;

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() { setenv("CL3_BENCH_MODE", "1", 1); }
} kBenchEnvSetup;
} // namespace

static std::vector<Cliffor> make_values(Variant v, size_t count, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::vector<Cliffor> out;
  out.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    out.push_back(cl3::sampling::random_of(v, 0.1, 1.0, rng));
  }
  return out;
}

static cl3::io::PackedBuffer make_buffer(size_t count) {
  std::mt19937_64 rng(42);
  cl3::io::PackedBuffer buf;
  buf.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    buf.push_back(cl3::sampling::random_cliffor(0.1, 1.0, rng));
  }
  return buf;
}

// state.range(0) is the variant index; both operands share it.
static void bench_product_naive(benchmark::State &state) {
  const Variant v = cl3::core::kAllVariants[static_cast<size_t>(state.range(0))];
  const auto lhs = make_values(v, 1024, 1);
  const auto rhs = make_values(v, 1024, 2);

  for (auto _ : state) {
    for (size_t i = 0; i < lhs.size(); ++i) {
      auto r = cl3::core::ProductKernels::multiply_naive(lhs[i].data(), rhs[i].data());
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lhs.size()));
  state.SetLabel(std::string(cl3::core::variant_name(v)));
}

static void bench_product_blocks(benchmark::State &state) {
  const Variant v = cl3::core::kAllVariants[static_cast<size_t>(state.range(0))];
  const auto lhs = make_values(v, 1024, 1);
  const auto rhs = make_values(v, 1024, 2);

  for (auto _ : state) {
    for (size_t i = 0; i < lhs.size(); ++i) {
      Cliffor r = lhs[i] * rhs[i];
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(lhs.size()));
  state.SetLabel(std::string(cl3::core::variant_name(v)));
}

static void bench_reduce(benchmark::State &state) {
  const auto values = make_values(Variant::APS, 1024, 3);
  for (auto _ : state) {
    for (const Cliffor &x : values) {
      Cliffor r = cl3::core::reduce(x);
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(values.size()));
}

static void bench_exp(benchmark::State &state) {
  const Variant v = cl3::core::kAllVariants[static_cast<size_t>(state.range(0))];
  const auto values = make_values(v, 256, 4);
  for (auto _ : state) {
    for (const Cliffor &x : values) {
      Cliffor r = cl3::ops::exp(x);
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(values.size()));
  state.SetLabel(std::string(cl3::core::variant_name(v)));
}

static void bench_recip_aps(benchmark::State &state) {
  const auto values = make_values(Variant::APS, 256, 5);
  for (auto _ : state) {
    for (const Cliffor &x : values) {
      Cliffor r = cl3::ops::recip(x);
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(values.size()));
}

static void bench_map_packed(benchmark::State &state) {
  const cl3::io::PackedBuffer in = make_buffer(static_cast<size_t>(state.range(0)));
  cl3::io::PackedBuffer out(in.size());
  for (auto _ : state) {
    cl3::ops::map_packed(in.raw(), out.raw(), cl3::ops::exp);
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void bench_add_packed(benchmark::State &state) {
  const cl3::io::PackedBuffer a = make_buffer(static_cast<size_t>(state.range(0)));
  const cl3::io::PackedBuffer b = make_buffer(static_cast<size_t>(state.range(0)));
  cl3::io::PackedBuffer out(a.size());
  for (auto _ : state) {
    cl3::ops::add_packed(a.raw(), b.raw(), out.raw());
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

// V3, H and APS cover the sparse, mid and dense cases.
BENCHMARK(bench_product_naive)->Arg(1)->Arg(5)->Arg(10);
BENCHMARK(bench_product_blocks)->Arg(1)->Arg(5)->Arg(10);
BENCHMARK(bench_reduce);
BENCHMARK(bench_exp)->Arg(0)->Arg(5)->Arg(7)->Arg(10);
BENCHMARK(bench_recip_aps);
BENCHMARK(bench_map_packed)->Arg(4096)->Arg(65536);
BENCHMARK(bench_add_packed)->Arg(65536);

BENCHMARK_MAIN();
