#pragma once

#include <bit>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace waypoint::http {

// Methods a route may be registered for. Each value is a single bit so that sets of
// methods can be stored as a MethodBmp.
enum class Method : uint8_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  OPTIONS = 1 << 5,
  PATCH = 1 << 6
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 7;

using MethodBmp = uint8_t;

inline constexpr MethodBmp kAllMethods = static_cast<MethodBmp>((1U << kNbMethods) - 1U);

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

static_assert(kNbMethods <= sizeof(MethodBmp) * 8,
              "MethodBmp type too small to hold all methods; increase size or change type");

// Check if a method is allowed by mask.
constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) { return static_cast<http::Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET", "HEAD", "POST", "PUT", "DELETE", "OPTIONS", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

}  // namespace waypoint::http
