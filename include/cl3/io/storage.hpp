#pragma once
#include <cl3/core/cliffor.hpp>
#include <cstddef>
#include <cstdlib>
#include <new>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>
#include <xsimd/xsimd.hpp>

namespace cl3::io {

using core::Cliffor;

/// \brief Doubles per record in the packed layout `[a0, a1, a2, a3, a23, a31, a12, a123]`.
inline constexpr std::size_t kRecordSize = core::kComponents;

/**
 * @brief Aligned allocator so packed buffers can be streamed into SIMD registers.
 */
template <typename T> struct AlignedAllocator {
  using value_type = T;
  static constexpr std::size_t alignment = xsimd::default_arch::alignment();

  AlignedAllocator() = default;
  template <typename U> AlignedAllocator(const AlignedAllocator<U> &) {}

  T *allocate(std::size_t n) {
    void *ptr = nullptr;
    if (posix_memalign(&ptr, alignment, n * sizeof(T)) != 0) {
      throw std::bad_alloc();
    }
    return static_cast<T *>(ptr);
  }

  void deallocate(T *p, std::size_t) { free(p); }

  template <typename U> bool operator==(const AlignedAllocator<U> &) const { return true; }
};

// ========================================================================
// 1. SINGLE RECORD
// ========================================================================

/// \brief Write the full 8-component embedding of `x`.
inline void store(const Cliffor &x, std::span<double, kRecordSize> out) {
  for (std::size_t i = 0; i < kRecordSize; ++i) {
    out[i] = x[i];
  }
}

/// \brief Read a record back; the result is always an `APS`.
inline Cliffor load(std::span<const double, kRecordSize> in) {
  core::Coefficients c{};
  for (std::size_t i = 0; i < kRecordSize; ++i) {
    c[i] = in[i];
  }
  return Cliffor::from_embedding(core::Variant::APS, c);
}

/**
 * \brief Number of records in a raw buffer of `length` doubles.
 * \throws std::invalid_argument if `length` is not a multiple of 8.
 */
inline std::size_t record_count(std::size_t length) {
  if (length % kRecordSize != 0) {
    throw std::invalid_argument("packed buffer length " + std::to_string(length) +
                                " is not a multiple of 8");
  }
  return length / kRecordSize;
}

inline std::span<const double, kRecordSize> record(std::span<const double> raw,
                                                   std::size_t index) {
  return raw.subspan(index * kRecordSize).first<kRecordSize>();
}

inline std::span<double, kRecordSize> record(std::span<double> raw, std::size_t index) {
  return raw.subspan(index * kRecordSize).first<kRecordSize>();
}

// ========================================================================
// 2. PACKED BUFFER
// ========================================================================

/**
 * @brief Contiguous, SIMD-aligned array of cliffors in the packed layout.
 *
 * Every record is stored in full form, so reading one back yields an `APS`.
 */
class PackedBuffer {
public:
  using Storage = std::vector<double, AlignedAllocator<double>>;

  PackedBuffer() = default;

  /// \brief `count` zero records.
  explicit PackedBuffer(std::size_t count) : data_(count * kRecordSize, 0.0) {}

  /**
   * \brief Copy a raw double buffer.
   * \throws std::invalid_argument if its length is not a multiple of 8.
   */
  explicit PackedBuffer(std::span<const double> raw) {
    record_count(raw.size());
    data_.assign(raw.begin(), raw.end());
  }

  static PackedBuffer pack(std::span<const Cliffor> values) {
    PackedBuffer buf(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
      store(values[i], buf.record(i));
    }
    return buf;
  }

  std::vector<Cliffor> unpack() const {
    std::vector<Cliffor> out;
    out.reserve(size());
    for (std::size_t i = 0; i < size(); ++i) {
      out.push_back(load(record(i)));
    }
    return out;
  }

  std::size_t size() const { return data_.size() / kRecordSize; }
  bool empty() const { return data_.empty(); }

  void reserve(std::size_t count) { data_.reserve(count * kRecordSize); }

  void push_back(const Cliffor &x) {
    data_.resize(data_.size() + kRecordSize);
    store(x, record(size() - 1));
  }

  /// \throws std::out_of_range for an index past the end.
  Cliffor at(std::size_t index) const {
    if (index >= size()) {
      throw std::out_of_range("packed buffer index " + std::to_string(index) +
                              " out of range");
    }
    return load(record(index));
  }

  /// \throws std::out_of_range for an index past the end.
  void set(std::size_t index, const Cliffor &x) {
    if (index >= size()) {
      throw std::out_of_range("packed buffer index " + std::to_string(index) +
                              " out of range");
    }
    store(x, record(index));
  }

  std::span<const double, kRecordSize> record(std::size_t index) const {
    return io::record(raw(), index);
  }
  std::span<double, kRecordSize> record(std::size_t index) {
    return io::record(raw(), index);
  }

  std::span<const double> raw() const { return data_; }
  std::span<double> raw() { return data_; }

private:
  Storage data_;
};

} // namespace cl3::io
