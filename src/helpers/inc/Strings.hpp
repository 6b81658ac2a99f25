#ifndef ECHOBENCH_HELPERS_STRINGS_HPP
#define ECHOBENCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String parsing helpers for CLI input.
 *
 * Strict parsers: whole-token match only, no silent defaults. A token that
 * does not parse completely is reported as a failure to the caller.
 *
 * @note RT-SAFE: All functions are noexcept with no allocations.
 */

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace echobench {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Strip leading and trailing spaces and tabs.
 * @param str Input view.
 * @return Sub-view without surrounding whitespace.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] constexpr std::string_view trimWhitespace(std::string_view str) noexcept {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
    str.remove_suffix(1);
  }
  return str;
}

/**
 * @brief Parse a base-10 unsigned integer occupying the whole token.
 * @tparam T Unsigned integral target type.
 * @param str Token to parse (surrounding whitespace is ignored).
 * @param out Receives the value on success; untouched on failure.
 * @return true if the token is a complete in-range unsigned number.
 * @note RT-SAFE: No allocation.
 *
 * Rejects empty input, signs ("+5", "-5"), trailing garbage ("12x") and
 * values that overflow T.
 */
template <typename T>
[[nodiscard]] inline bool parseUnsigned(std::string_view str, T& out) noexcept {
  static_assert(std::is_unsigned_v<T>, "parseUnsigned requires an unsigned type");

  str = trimWhitespace(str);
  if (str.empty() || str.front() < '0' || str.front() > '9') {
    return false;
  }

  T value{};
  const char* const END = str.data() + str.size();
  const auto [PTR, EC] = std::from_chars(str.data(), END, value, 10);
  if (EC != std::errc{} || PTR != END) {
    return false;
  }

  out = value;
  return true;
}

/**
 * @brief Split "host:port" or "[v6-host]:port" into its two halves.
 * @param address Address text.
 * @param host    Receives the host part (brackets removed).
 * @param port    Receives the numeric port.
 * @return true if both halves are present and the port is 1-65535.
 * @note RT-SAFE: Views into address; no allocation.
 *
 * The port separator is the last ':' so that bracketed IPv6 literals
 * ("[::1]:7") split correctly. Unbracketed hosts must not contain ':'.
 */
[[nodiscard]] inline bool splitHostPort(std::string_view address, std::string_view& host,
                                        std::uint16_t& port) noexcept {
  address = trimWhitespace(address);

  const std::size_t SEP = address.rfind(':');
  if (SEP == std::string_view::npos || SEP == 0) {
    return false;
  }

  std::string_view hostPart = address.substr(0, SEP);
  const std::string_view PORT_PART = address.substr(SEP + 1);

  if (hostPart.front() == '[') {
    if (hostPart.size() < 3 || hostPart.back() != ']') {
      return false;
    }
    hostPart = hostPart.substr(1, hostPart.size() - 2);
  } else if (hostPart.find(':') != std::string_view::npos) {
    return false;
  }

  std::uint16_t portValue = 0;
  if (!parseUnsigned(PORT_PART, portValue) || portValue == 0) {
    return false;
  }

  host = hostPart;
  port = portValue;
  return true;
}

} // namespace strings
} // namespace helpers
} // namespace echobench

#endif // ECHOBENCH_HELPERS_STRINGS_HPP
