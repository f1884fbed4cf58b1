#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/path-pattern.hpp"

namespace waypoint {

// A compiled path template bound to a set of methods, a priority and a handler.
//
// Construction validates the whole configuration and throws std::invalid_argument on:
//  - a malformed template (see PathPattern)
//  - an empty or unknown method name (known: GET, HEAD, POST, PUT, DELETE, OPTIONS, PATCH, upper case)
//  - a path parameter not bound by the handler, or a handler binding absent from the template
//  - a handler binding whose declared type differs from the value type of the parameter kind
// A Route is immutable once built.
class Route {
 public:
  // An empty 'methods' bitmap means GET only.
  Route(std::string_view pathTemplate, HandlerAdapter handler, http::MethodBmp methods = 0, int32_t priority = 0,
        std::string_view name = {});

  Route(std::string_view pathTemplate, HandlerAdapter handler, std::span<const std::string_view> methodNames,
        int32_t priority = 0, std::string_view name = {});

  Route(std::string_view pathTemplate, HandlerAdapter handler, std::initializer_list<std::string_view> methodNames,
        int32_t priority = 0, std::string_view name = {});

  // Normalized template (trailing slash stripped, except for the root path).
  [[nodiscard]] std::string_view path() const noexcept { return _pattern.str(); }

  [[nodiscard]] const PathPattern& pattern() const noexcept { return _pattern; }

  [[nodiscard]] http::MethodBmp methods() const noexcept { return _methods; }

  [[nodiscard]] bool allows(http::Method method) const noexcept { return http::IsMethodSet(_methods, method); }

  [[nodiscard]] int32_t priority() const noexcept { return _priority; }

  // Optional route name, empty if none.
  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] const HandlerAdapter& adapter() const noexcept { return _handler; }

  // Matches 'path' against the pattern, ignoring the method.
  // A cheap segment count check runs first. It passes if the raw segment counts are equal, if the
  // counts are equal once the trailing slash is stripped from 'path', or if 'path' has more
  // segments and the route has a multipath parameter.
  // Routes with a multipath parameter are matched against the raw path first (so that "/files/" can
  // match "/files/{p:multipath}" with an empty p), then against the normalized path.
  // A parameter conversion failure is reported as no match.
  [[nodiscard]] std::optional<PathParams> matchesPath(std::string_view path) const;

  // Same as matchesPath, after checking that 'method' is allowed.
  [[nodiscard]] std::optional<PathParams> matches(std::string_view path, http::Method method) const;

  // Invokes the handler with the path parameters stored in the request.
  HttpResponse handle(HttpRequest& request) const { return _handler(request, request.pathParams()); }

  HttpResponse handle(HttpRequest& request, const PathParams& params) const { return _handler(request, params); }

  // Copy of this route with its template mounted under 'prefix'. The new template is compiled and
  // validated again.
  [[nodiscard]] Route withPrefix(std::string_view prefix) const;

  // Human readable description, e.g. "<Route GET,POST /users/{id:int} priority=5>"
  [[nodiscard]] std::string str() const;

 private:
  void validateBindings() const;

  http::MethodBmp _methods;
  int32_t _priority;
  PathPattern _pattern;
  HandlerAdapter _handler;
  std::string _name;
};

}  // namespace waypoint
