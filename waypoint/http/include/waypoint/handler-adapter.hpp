#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/uuid.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// C++ value type a handler expects for a path parameter.
enum class ParamValueType : uint8_t { String, Integer, Float, Uuid };

std::string_view ParamValueTypeToStr(ParamValueType type) noexcept;

// Value type produced by the conversion of a parameter of given kind.
// Both String and MultiSegment parameters produce a String.
constexpr ParamValueType ValueTypeOf(ParamKind kind) noexcept {
  switch (kind) {
    case ParamKind::Integer:
      return ParamValueType::Integer;
    case ParamKind::Float:
      return ParamValueType::Float;
    case ParamKind::Uuid:
      return ParamValueType::Uuid;
    default:
      return ParamValueType::String;
  }
}

template <class T>
constexpr ParamValueType ValueTypeFor() noexcept {
  if constexpr (std::is_same_v<T, std::string>) {
    return ParamValueType::String;
  } else if constexpr (std::is_same_v<T, int64_t>) {
    return ParamValueType::Integer;
  } else if constexpr (std::is_same_v<T, double>) {
    return ParamValueType::Float;
  } else {
    static_assert(std::is_same_v<T, Uuid>, "path parameter values are std::string, int64_t, double or Uuid");
    return ParamValueType::Uuid;
  }
}

// Declaration of a path parameter consumed by a handler.
// The declared type is optional: an untyped binding accepts a parameter of any kind.
struct ParamBinding {
  ParamBinding(const char* bindingName) : name(bindingName) {}  // NOLINT(google-explicit-constructor)
  ParamBinding(std::string_view bindingName) : name(bindingName) {}  // NOLINT(google-explicit-constructor)
  ParamBinding(std::string_view bindingName, ParamValueType type) : name(bindingName), declaredType(type) {}

  // Typed binding for the C++ type T of the parameter value.
  // Example: ParamBinding::Of<int64_t>("id")
  template <class T>
  static ParamBinding Of(std::string_view bindingName) {
    return {bindingName, ValueTypeFor<T>()};
  }

  bool operator==(const ParamBinding&) const = default;

  std::string name;
  std::optional<ParamValueType> declaredType;
};

// Whether the handler takes the request object in addition to its path parameters.
enum class RequestSlot : uint8_t { None, Wanted };

// Handler as seen by the routing core. 'request' is nullptr when the adapter was declared
// with RequestSlot::None.
using HandlerFunction = std::function<HttpResponse(HttpRequest* request, const PathParams& params)>;

// Explicit description of a route handler: the callable plus the list of path parameters it
// consumes. The Route validates this list against its compiled template at construction.
class HandlerAdapter {
 public:
  // Name reserved for the request slot, which cannot be used as a parameter binding.
  static constexpr std::string_view kRequestSlotName = "request";

  // Throws std::invalid_argument if 'handler' is empty, or if a binding is duplicated or uses the
  // reserved name "request".
  HandlerAdapter(HandlerFunction handler, std::initializer_list<ParamBinding> bindings,
                 RequestSlot requestSlot = RequestSlot::Wanted);

  HandlerAdapter(HandlerFunction handler, std::span<const ParamBinding> bindings,
                 RequestSlot requestSlot = RequestSlot::Wanted);

  // Adapter for a handler taking only the request, with no path parameters.
  // Implicit so that plain request handlers can be registered directly on a Router.
  // The handler is called through a const reference, as it may serve concurrent requests.
  template <class Func>
    requires std::is_invocable_r_v<HttpResponse, const Func&, HttpRequest&>
  HandlerAdapter(Func func)  // NOLINT(google-explicit-constructor)
      : HandlerAdapter(
            [func = std::move(func)](HttpRequest* request, [[maybe_unused]] const PathParams& params) {
              return func(*request);
            },
            std::span<const ParamBinding>{}, RequestSlot::Wanted) {}

  [[nodiscard]] std::span<const ParamBinding> bindings() const noexcept { return _bindings; }

  [[nodiscard]] const ParamBinding* findBinding(std::string_view name) const noexcept;

  [[nodiscard]] bool wantsRequest() const noexcept { return _requestSlot == RequestSlot::Wanted; }

  // Calls the handler. 'request' is only forwarded if the adapter wants it.
  HttpResponse operator()(HttpRequest& request, const PathParams& params) const;

 private:
  void validate() const;

  HandlerFunction _handler;
  vector<ParamBinding> _bindings;
  RequestSlot _requestSlot;
};

}  // namespace waypoint
