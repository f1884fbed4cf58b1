#include "waypoint/path-params.hpp"

#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "waypoint/uuid.hpp"

namespace waypoint {

namespace {

constexpr std::string_view kParamKindNames[] = {"str", "int", "float", "uuid", "multipath"};

}  // namespace

std::string_view ParamKindToStr(ParamKind kind) noexcept { return kParamKindNames[static_cast<uint8_t>(kind)]; }

std::optional<ParamKind> ParamKindFromStr(std::string_view str) noexcept {
  for (uint8_t kindIdx = 0; kindIdx < std::size(kParamKindNames); ++kindIdx) {
    if (kParamKindNames[kindIdx] == str) {
      return static_cast<ParamKind>(kindIdx);
    }
  }
  return std::nullopt;
}

std::string PathParamValueToStr(const PathParamValue& value) {
  return std::visit(
      [](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return val;
        } else if constexpr (std::is_same_v<T, Uuid>) {
          return val.str();
        } else {
          // shortest representation that round trips, for both int64_t and double
          char buf[32];
          return std::string(buf, std::to_chars(buf, buf + sizeof(buf), val).ptr);
        }
      },
      value);
}

const PathParamValue* PathParams::find(std::string_view name) const noexcept {
  for (const PathParam& param : _params) {
    if (param.name == name) {
      return &param.value;
    }
  }
  return nullptr;
}

}  // namespace waypoint
