#include "waypoint/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "waypoint/ascii.hpp"

namespace waypoint {

namespace {

constexpr bool IsHyphenPos(std::size_t pos) { return pos == 8 || pos == 13 || pos == 18 || pos == 23; }

}  // namespace

std::optional<Uuid> Uuid::Parse(std::string_view str) noexcept {
  if (str.size() != kCanonicalLen) {
    return std::nullopt;
  }

  Bytes bytes;
  std::size_t byteIdx = 0;
  for (std::size_t pos = 0; pos < kCanonicalLen;) {
    if (IsHyphenPos(pos)) {
      if (str[pos] != '-') {
        return std::nullopt;
      }
      ++pos;
      continue;
    }
    const int high = FromHexDigit(str[pos]);
    const int low = FromHexDigit(str[pos + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    bytes[byteIdx++] = static_cast<uint8_t>((high << 4) | low);
    pos += 2;
  }
  return Uuid(bytes);
}

std::string Uuid::str() const {
  static constexpr std::string_view kHexits = "0123456789abcdef";

  std::string out;
  out.reserve(kCanonicalLen);
  for (std::size_t byteIdx = 0; byteIdx < kNbBytes; ++byteIdx) {
    if (byteIdx == 4 || byteIdx == 6 || byteIdx == 8 || byteIdx == 10) {
      out.push_back('-');
    }
    out.push_back(kHexits[_bytes[byteIdx] >> 4U]);
    out.push_back(kHexits[_bytes[byteIdx] & 0x0FU]);
  }
  return out;
}

}  // namespace waypoint
