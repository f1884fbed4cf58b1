#include "waypoint/http-header.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "waypoint/ascii.hpp"

namespace waypoint::http {

std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view name) noexcept {
  for (const Header& header : headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

void SetHeader(Headers& headers, std::string_view name, std::string_view value) {
  for (Header& header : headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      header.value.assign(value);
      return;
    }
  }
  headers.push_back(Header{std::string(name), std::string(value)});
}

}  // namespace waypoint::http
