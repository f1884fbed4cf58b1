#include "waypoint/router-config.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "waypoint/http-method.hpp"

namespace waypoint {

RouterConfig& RouterConfig::withPrefix(std::string_view routePrefix) {
  prefix.assign(routePrefix);
  return *this;
}

RouterConfig& RouterConfig::withDefaultMethods(http::MethodBmp methods) {
  defaultMethods = methods;
  return *this;
}

void RouterConfig::validate() {
  if (prefix.find('*') != std::string::npos) {
    throw std::invalid_argument("Router prefix '" + prefix + "' cannot contain wildcards");
  }
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.pop_back();
  }
  if (!prefix.empty() && prefix.front() != '/') {
    prefix.insert(prefix.begin(), '/');
  }

  if (defaultMethods == 0) {
    throw std::invalid_argument("Router default methods cannot be empty");
  }
  if ((defaultMethods & ~http::kAllMethods) != 0) {
    throw std::invalid_argument("Router default methods contain unknown method bits");
  }
}

}  // namespace waypoint
