#pragma once

#include <string>
#include <string_view>

#include "waypoint/http-method.hpp"

namespace waypoint {

struct RouterConfig {
  // Prefix prepended to every template registered on (or included into) the router.
  // Normalized by validate(): a leading slash is added if missing, trailing slashes are removed.
  // Default: empty (no prefix)
  std::string prefix;

  // Methods used for routes registered with an empty method set.
  // Default: GET
  http::MethodBmp defaultMethods{static_cast<http::MethodBmp>(http::Method::GET)};

  RouterConfig& withPrefix(std::string_view routePrefix);

  RouterConfig& withDefaultMethods(http::MethodBmp methods);

  // Validates and normalizes the configuration. Throws std::invalid_argument if invalid.
  void validate();
};

}  // namespace waypoint
