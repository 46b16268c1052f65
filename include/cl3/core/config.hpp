#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fmt/core.h>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace cl3::core {

namespace detail {

/// \brief Value of environment variable `name`, empty when unset or blank.
inline std::optional<std::string> env_value(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

} // namespace detail

/// \brief How `map_packed` and `zip_packed` spread records over threads.
struct BulkConfig {
  /// \brief False when `CL3_BACKEND=cpu` asks for a serial loop.
  bool parallel = true;
  /// \brief Participants including the caller, from `CL3_NUM_THREADS`.
  int threads = 1;
};

/**
 * \brief Read the bulk settings from `CL3_BACKEND` and `CL3_NUM_THREADS`.
 *
 * The backend name is case-insensitive; anything but `cpu` is parallel.
 * A missing or non-positive thread count falls back to the hardware
 * concurrency.
 */
inline BulkConfig bulk_config_from_env() {
  BulkConfig config;
  if (auto backend = detail::env_value("CL3_BACKEND")) {
    std::transform(backend->begin(), backend->end(), backend->begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    config.parallel = *backend != "cpu";
  }

  config.threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
  if (const auto count = detail::env_value("CL3_NUM_THREADS")) {
    const int requested = std::atoi(count->c_str());
    if (requested > 0) {
      config.threads = requested;
    }
  }
  return config;
}

/**
 * \brief Seed for demo and benchmark generators from `CL3_SEED`.
 * \return Parsed seed, or empty when unset or not a number.
 */
inline std::optional<std::uint64_t> seed_from_env() {
  const auto raw = detail::env_value("CL3_SEED");
  if (!raw) {
    return std::nullopt;
  }
  char *end = nullptr;
  const unsigned long long value = std::strtoull(raw->c_str(), &end, 10);
  if (*end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(value);
}

/// \brief Diagnostics print only with `CL3_VERBOSE` set and `CL3_BENCH_MODE` unset.
inline bool verbose_from_env() {
  if (std::getenv("CL3_BENCH_MODE") != nullptr) {
    return false;
  }
  const auto raw = detail::env_value("CL3_VERBOSE");
  return raw && *raw != "0";
}

/**
 * \brief Print a tagged diagnostic line, e.g. `[Bulk] mapped 128 values`.
 * \param tag Component tag without brackets.
 */
template <typename... Args>
void log_line(const char *tag, fmt::format_string<Args...> format, Args &&...args) {
  if (!verbose_from_env()) {
    return;
  }
  fmt::print("[{}] ", tag);
  fmt::print(format, std::forward<Args>(args)...);
  fmt::print("\n");
}

} // namespace cl3::core
