#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "waypoint/uuid.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// Conversion / matching type of a path parameter, written after the colon in a template ({id:int}).
enum class ParamKind : uint8_t { String, Integer, Float, Uuid, MultiSegment };

// Template spelling of the kind: "str", "int", "float", "uuid" or "multipath".
std::string_view ParamKindToStr(ParamKind kind) noexcept;

// Inverse of ParamKindToStr. Returns std::nullopt for unsupported kind names.
std::optional<ParamKind> ParamKindFromStr(std::string_view str) noexcept;

// Converted value of a path parameter:
//  - String and MultiSegment -> std::string
//  - Integer                 -> int64_t
//  - Float                   -> double
//  - Uuid                    -> Uuid
using PathParamValue = std::variant<std::string, int64_t, double, Uuid>;

// Textual form of a value, as it would appear in a path.
std::string PathParamValueToStr(const PathParamValue& value);

struct PathParam {
  bool operator==(const PathParam&) const = default;

  std::string name;
  PathParamValue value;
};

// Converted path parameters of a matched route, in template order.
// Request scoped: each match produces its own instance.
class PathParams {
 public:
  using const_iterator = vector<PathParam>::const_iterator;

  PathParams() noexcept = default;

  void add(std::string name, PathParamValue value) { _params.push_back(PathParam{std::move(name), std::move(value)}); }

  // Returns a pointer to the value of given parameter, or nullptr if absent.
  [[nodiscard]] const PathParamValue* find(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

  // Returns a pointer to the value of given parameter if present and holding a T, nullptr otherwise.
  template <class T>
  [[nodiscard]] const T* getIf(std::string_view name) const noexcept {
    const PathParamValue* pValue = find(name);
    return pValue == nullptr ? nullptr : std::get_if<T>(pValue);
  }

  // Returns the value of given parameter.
  // Throws std::out_of_range if absent and std::bad_variant_access if it does not hold a T.
  template <class T>
  [[nodiscard]] const T& get(std::string_view name) const {
    const PathParamValue* pValue = find(name);
    if (pValue == nullptr) {
      throw std::out_of_range(std::string("Unknown path parameter '").append(name).append("'"));
    }
    return std::get<T>(*pValue);
  }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] const PathParam& operator[](std::size_t pos) const { return _params[pos]; }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.end(); }

  void clear() noexcept { _params.clear(); }

  bool operator==(const PathParams&) const = default;

 private:
  vector<PathParam> _params;
};

}  // namespace waypoint
