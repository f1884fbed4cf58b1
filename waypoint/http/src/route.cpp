#include "waypoint/route.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-method-parse.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/path-pattern.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

namespace {

http::MethodBmp CheckMethods(http::MethodBmp methods) {
  if (methods == 0) {
    return static_cast<http::MethodBmp>(http::Method::GET);
  }
  if ((methods & ~http::kAllMethods) != 0) {
    throw std::invalid_argument("Invalid HTTP method bits in route method set");
  }
  return methods;
}

http::MethodBmp ParseMethodNames(std::span<const std::string_view> methodNames) {
  http::MethodBmp methods = 0;
  std::string invalidMethods;
  for (std::string_view methodName : methodNames) {
    const auto optMethod = http::MethodStrToOptEnumStrict(methodName);
    if (optMethod) {
      methods = methods | *optMethod;
      continue;
    }
    if (!invalidMethods.empty()) {
      invalidMethods.append(", ");
    }
    invalidMethods.push_back('\'');
    invalidMethods.append(methodName);
    invalidMethods.push_back('\'');
  }
  if (!invalidMethods.empty()) {
    throw std::invalid_argument("Invalid HTTP methods: " + invalidMethods);
  }
  return CheckMethods(methods);
}

template <class Range>
std::string JoinNames(const Range& range) {
  std::string out("[");
  for (const auto& elem : range) {
    if (out.size() > 1U) {
      out.append(", ");
    }
    out.append(elem.name);
  }
  out.push_back(']');
  return out;
}

}  // namespace

Route::Route(std::string_view pathTemplate, HandlerAdapter handler, http::MethodBmp methods, int32_t priority,
             std::string_view name)
    : _methods(CheckMethods(methods)),
      _priority(priority),
      _pattern(pathTemplate),
      _handler(std::move(handler)),
      _name(name) {
  validateBindings();
}

Route::Route(std::string_view pathTemplate, HandlerAdapter handler, std::span<const std::string_view> methodNames,
             int32_t priority, std::string_view name)
    : _methods(ParseMethodNames(methodNames)),
      _priority(priority),
      _pattern(pathTemplate),
      _handler(std::move(handler)),
      _name(name) {
  validateBindings();
}

Route::Route(std::string_view pathTemplate, HandlerAdapter handler, std::initializer_list<std::string_view> methodNames,
             int32_t priority, std::string_view name)
    : Route(pathTemplate, std::move(handler), std::span<const std::string_view>(methodNames.begin(), methodNames.size()),
            priority, name) {}

void Route::validateBindings() const {
  vector<ParameterSpec> missingInHandler;
  for (const ParameterSpec& param : _pattern.params()) {
    if (_handler.findBinding(param.name) == nullptr) {
      missingInHandler.push_back(param);
    }
  }
  if (!missingInHandler.empty()) {
    throw std::invalid_argument("Route pattern '" + std::string(path()) + "' defines path parameters " +
                                JoinNames(missingInHandler) +
                                " but handler does not bind them. Handler parameters: " +
                                JoinNames(_handler.bindings()));
  }

  vector<ParamBinding> missingInRoute;
  for (const ParamBinding& binding : _handler.bindings()) {
    if (_pattern.findParam(binding.name) == nullptr) {
      missingInRoute.push_back(binding);
    }
  }
  if (!missingInRoute.empty()) {
    throw std::invalid_argument("Handler expects path parameters " + JoinNames(missingInRoute) + " but route pattern '" +
                                std::string(path()) + "' only defines " + JoinNames(_pattern.params()));
  }

  for (const ParamBinding& binding : _handler.bindings()) {
    if (!binding.declaredType) {
      continue;
    }
    const ParameterSpec& param = *_pattern.findParam(binding.name);
    const ParamValueType expected = ValueTypeOf(param.kind);
    if (expected != *binding.declaredType) {
      throw std::invalid_argument("Parameter '" + binding.name + "' type mismatch: route expects " +
                                  std::string(ParamValueTypeToStr(expected)) + " (" +
                                  std::string(ParamKindToStr(param.kind)) + ") but handler declares " +
                                  std::string(ParamValueTypeToStr(*binding.declaredType)));
    }
  }
}

std::optional<PathParams> Route::matchesPath(std::string_view path) const {
  const uint32_t routeSegments = _pattern.segmentCount();
  const uint32_t requestSegments = CountPathSegments(path);
  const std::string_view normalizedPath = NormalizeTrailingSlash(path);
  const uint32_t normalizedSegments = CountPathSegments(normalizedPath);

  const bool segmentsMayMatch = requestSegments == routeSegments || normalizedSegments == routeSegments ||
                                (requestSegments > routeSegments && _pattern.hasTailParameter());
  if (!segmentsMayMatch) {
    return std::nullopt;
  }

  if (_pattern.hasTailParameter()) {
    auto params = _pattern.match(path);
    if (params) {
      return params;
    }
  }
  return _pattern.match(normalizedPath);
}

std::optional<PathParams> Route::matches(std::string_view path, http::Method method) const {
  if (!allows(method)) {
    return std::nullopt;
  }
  return matchesPath(path);
}

Route Route::withPrefix(std::string_view prefix) const {
  return {JoinPaths(prefix, path()), _handler, _methods, _priority, _name};
}

std::string Route::str() const {
  std::string out("<Route ");
  out.append(http::MethodBmpToStr(_methods, ","));
  out.push_back(' ');
  out.append(path());
  if (_priority != 0) {
    out.append(" priority=");
    out.append(std::to_string(_priority));
  }
  out.push_back('>');
  return out;
}

}  // namespace waypoint
