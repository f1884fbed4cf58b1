#pragma once

#include <cstddef>
#include <string_view>

namespace waypoint {

// Locale independent ASCII helpers. Non letters are returned unchanged.
constexpr char tolower(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr char toupper(char ch) {
  if (ch >= 'a' && ch <= 'z') {
    return static_cast<char>(ch & 0xDF);  // clear lowercase bit
  }
  return ch;
}

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int FromHexDigit(char ch) {
  if (IsDigit(ch)) {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

}  // namespace waypoint
