#pragma once
#include <cl3/core/cliffor.hpp>
#include <cstddef>
#include <cstdlib>
#include <fmt/format.h>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cl3::io {

/**
 * \brief Render `x` for Octave, using the Pauli-matrix basis
 *
 * `e0 = [1,0;0,1]; e1 = [0,1;1,0]; e2 = [0,-i;i,0]; e3 = [1,0;0,-1];`
 *
 * Bivector terms become imaginary vector terms and the trivector an
 * imaginary scalar, e.g. `BV(1,2,3)` -> `1i*e1 + 2i*e2 + 3i*e3`.
 */
inline std::string show_octave(const core::Cliffor &x) {
  constexpr const char *kTerms[core::kComponents] = {"*e0",  "*e1",  "*e2",  "*e3",
                                                     "i*e1", "i*e2", "i*e3", "i*e0"};
  fmt::memory_buffer buf;
  bool first = true;
  for (std::size_t i = 0; i < core::kComponents; ++i) {
    if (!core::in_support(x.variant(), i))
      continue;
    if (!first)
      fmt::format_to(std::back_inserter(buf), " + ");
    fmt::format_to(std::back_inserter(buf), "{}{}", x[i], kTerms[i]);
    first = false;
  }
  return fmt::to_string(buf);
}


namespace detail {

inline std::string_view trim(std::string_view s) {
  const auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
  while (!s.empty() && blank(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && blank(s.back()))
    s.remove_suffix(1);
  return s;
}

[[noreturn]] inline void parse_error(std::string_view text, const std::string &what) {
  throw std::invalid_argument(fmt::format("cannot parse cliffor '{}': {}", text, what));
}

} // namespace detail

/**
 * \brief Read back the `Variant(field, ...)` text the formatter writes.
 *
 * Fields are the variant's own components in storage order; `inf` and `nan`
 * are accepted. Surrounding whitespace is ignored.
 * \throws std::invalid_argument on an unknown variant, a malformed number or
 *         a field count that does not match the variant.
 */
inline core::Cliffor parse_cliffor(std::string_view text) {
  const std::string_view body = detail::trim(text);
  const std::size_t open = body.find('(');
  if (open == std::string_view::npos || body.back() != ')')
    detail::parse_error(text, "expected Variant(...)");

  const std::string_view name = detail::trim(body.substr(0, open));
  const core::Variant *variant = nullptr;
  for (const core::Variant &v : core::kAllVariants) {
    if (core::variant_name(v) == name)
      variant = &v;
  }
  if (variant == nullptr)
    detail::parse_error(text, fmt::format("unknown variant '{}'", name));

  core::Coefficients c{};
  std::size_t slot = 0;
  std::string_view rest = body.substr(open + 1, body.size() - open - 2);
  bool more = !detail::trim(rest).empty();
  while (more) {
    const std::size_t comma = rest.find(',');
    more = comma != std::string_view::npos;
    const std::string field(detail::trim(rest.substr(0, comma)));
    rest = more ? rest.substr(comma + 1) : std::string_view{};

    while (slot < core::kComponents && !core::in_support(*variant, slot))
      ++slot;
    if (slot == core::kComponents)
      detail::parse_error(text, "too many fields");

    char *end = nullptr;
    const double value = std::strtod(field.c_str(), &end);
    if (field.empty() || end != field.c_str() + field.size())
      detail::parse_error(text, fmt::format("bad number '{}'", field));
    c[slot++] = value;
  }

  while (slot < core::kComponents && !core::in_support(*variant, slot))
    ++slot;
  if (slot != core::kComponents)
    detail::parse_error(text, "too few fields");
  return core::Cliffor::from_embedding(*variant, c);
}

} // namespace cl3::io

/// \brief Prints `Variant(field, ...)` with the variant's own fields, e.g. `H(0, 0, 0, 1)`.
template <> struct fmt::formatter<cl3::core::Cliffor> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const cl3::core::Cliffor &x, FormatContext &ctx) const -> decltype(ctx.out()) {
    auto out = fmt::format_to(ctx.out(), "{}(", cl3::core::variant_name(x.variant()));
    bool first = true;
    for (std::size_t i = 0; i < cl3::core::kComponents; ++i) {
      if (!cl3::core::in_support(x.variant(), i))
        continue;
      if (first) {
        out = fmt::format_to(out, "{}", x[i]);
        first = false;
      } else {
        out = fmt::format_to(out, ", {}", x[i]);
      }
    }
    return fmt::format_to(out, ")");
  }
};

namespace cl3::core {

inline std::ostream &operator<<(std::ostream &os, const Cliffor &x) {
  return os << fmt::format("{}", x);
}

} // namespace cl3::core
