#pragma once
#include <cl3/core/cliffor.hpp>
#include <cl3/core/config.hpp>
#include <cl3/core/parallel.hpp>
#include <cl3/io/storage.hpp>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <xsimd/xsimd.hpp>

namespace cl3::ops {

// ========================================================================
// 1. PER-RECORD EVALUATION
// ========================================================================
// Each record is loaded as an APS, transformed, and stored back in full form.
// Records are independent, so the parallel result matches a serial loop.
// Aliasing `out` with an input is fine: a record is read before it is written.

namespace detail {

inline std::size_t checked_records(std::span<const double> in, std::span<const double> out) {
  const std::size_t n = io::record_count(in.size());
  if (out.size() != in.size()) {
    throw std::invalid_argument("packed output holds " + std::to_string(out.size()) +
                                " doubles, expected " + std::to_string(in.size()));
  }
  return n;
}

inline const char *backend_name() { return core::bulk_config_from_env().parallel ? "parallel" : "cpu"; }

} // namespace detail

/**
 * \brief `out[i] = fn(in[i])` over packed records.
 * \throws std::invalid_argument on a length that is not a multiple of 8 or
 *         mismatched input/output lengths.
 */
template <typename Fn>
void map_packed(std::span<const double> in, std::span<double> out, Fn &&fn) {
  const std::size_t n = detail::checked_records(in, out);
  core::log_line("Bulk", "map over {} cliffors (backend={})", n, detail::backend_name());
  core::for_each_record_block(n, [&](core::RecordBlock block) {
    for (std::size_t i = block.first; i < block.last; ++i) {
      io::store(fn(io::load(io::record(in, i))), io::record(out, i));
    }
  });
}

/**
 * \brief `out[i] = fn(a[i], b[i])` over packed records.
 * \throws std::invalid_argument on bad or mismatched lengths.
 */
template <typename Fn>
void zip_packed(std::span<const double> a, std::span<const double> b, std::span<double> out,
                Fn &&fn) {
  const std::size_t n = detail::checked_records(a, out);
  if (b.size() != a.size()) {
    throw std::invalid_argument("packed operands differ in length: " +
                                std::to_string(a.size()) + " vs " + std::to_string(b.size()));
  }
  core::log_line("Bulk", "zip over {} cliffor pairs (backend={})", n, detail::backend_name());
  core::for_each_record_block(n, [&](core::RecordBlock block) {
    for (std::size_t i = block.first; i < block.last; ++i) {
      io::store(fn(io::load(io::record(a, i)), io::load(io::record(b, i))), io::record(out, i));
    }
  });
}

// ========================================================================
// 2. SIMD LINEAR KERNELS
// ========================================================================
// Addition and scaling act component-wise on the full embedding, so they
// stream straight through xsimd batches without unpacking.

/// \brief `out = a + b` record-wise.
inline void add_packed(std::span<const double> a, std::span<const double> b,
                       std::span<double> out) {
  detail::checked_records(a, out);
  if (b.size() != a.size()) {
    throw std::invalid_argument("packed operands differ in length: " +
                                std::to_string(a.size()) + " vs " + std::to_string(b.size()));
  }
  using Batch = xsimd::batch<double>;
  constexpr std::size_t width = Batch::size;
  const std::size_t total = a.size();
  const std::size_t vec_end = total - total % width;

  std::size_t i = 0;
  for (; i < vec_end; i += width) {
    const Batch lhs = Batch::load_unaligned(a.data() + i);
    const Batch rhs = Batch::load_unaligned(b.data() + i);
    (lhs + rhs).store_unaligned(out.data() + i);
  }
  for (; i < total; ++i) {
    out[i] = a[i] + b[i];
  }
}

/// \brief `out = s * in` record-wise.
inline void scale_packed(std::span<const double> in, double s, std::span<double> out) {
  detail::checked_records(in, out);
  using Batch = xsimd::batch<double>;
  constexpr std::size_t width = Batch::size;
  const std::size_t total = in.size();
  const std::size_t vec_end = total - total % width;
  const Batch factor(s);

  std::size_t i = 0;
  for (; i < vec_end; i += width) {
    (Batch::load_unaligned(in.data() + i) * factor).store_unaligned(out.data() + i);
  }
  for (; i < total; ++i) {
    out[i] = in[i] * s;
  }
}

} // namespace cl3::ops
