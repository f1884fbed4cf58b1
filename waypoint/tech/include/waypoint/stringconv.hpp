#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>

namespace waypoint {

// Parses the whole of 'str' as a base 10 integral.
// Returns std::nullopt on empty input, trailing characters or out of range values.
template <std::integral Integral>
std::optional<Integral> StringToIntegral(std::string_view str) noexcept {
  Integral ret;

  const char* begPtr = str.data();
  const char* endPtr = begPtr + str.size();
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);

  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

// Parses the whole of 'str' as a double in fixed or scientific notation.
// Same failure semantics as StringToIntegral.
inline std::optional<double> StringToDouble(std::string_view str) noexcept {
  double ret;

  const char* begPtr = str.data();
  const char* endPtr = begPtr + str.size();
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);

  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

}  // namespace waypoint
