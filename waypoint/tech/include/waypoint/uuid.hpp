#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace waypoint {

// 128-bit universally unique identifier stored in network byte order.
class Uuid {
 public:
  static constexpr std::size_t kNbBytes = 16;

  // Length of the canonical textual form, e.g. "123e4567-e89b-12d3-a456-426614174000".
  static constexpr std::size_t kCanonicalLen = 36;

  using Bytes = std::array<uint8_t, kNbBytes>;

  // The nil UUID (all bits zero).
  constexpr Uuid() noexcept = default;

  constexpr explicit Uuid(const Bytes& bytes) noexcept : _bytes(bytes) {}

  // Parses the canonical 8-4-4-4-12 hyphenated hexadecimal form.
  // Hex digits may be upper or lower case. Returns std::nullopt on any deviation.
  static std::optional<Uuid> Parse(std::string_view str) noexcept;

  [[nodiscard]] const Bytes& bytes() const noexcept { return _bytes; }

  // RFC 9562 version nibble (0 for the nil UUID).
  [[nodiscard]] uint8_t version() const noexcept { return static_cast<uint8_t>(_bytes[6] >> 4U); }

  [[nodiscard]] bool isNil() const noexcept { return *this == Uuid{}; }

  // Canonical lower case representation.
  [[nodiscard]] std::string str() const;

  bool operator==(const Uuid&) const noexcept = default;

 private:
  Bytes _bytes{};
};

}  // namespace waypoint
