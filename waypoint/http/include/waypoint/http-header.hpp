#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "waypoint/vector.hpp"

namespace waypoint::http {

struct Header {
  bool operator==(const Header&) const = default;

  std::string name;
  std::string value;
};

using Headers = vector<Header>;

// Case-insensitive lookup of the first header named 'name'.
std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view name) noexcept;

// Replaces the value of the first header named 'name' (case-insensitive), or appends it.
void SetHeader(Headers& headers, std::string_view name, std::string_view value);

}  // namespace waypoint::http
