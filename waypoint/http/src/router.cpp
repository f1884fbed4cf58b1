#include "waypoint/router.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-method-parse.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/log.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/path-pattern.hpp"
#include "waypoint/route.hpp"
#include "waypoint/router-config.hpp"

namespace waypoint {

Router::Router(RouterConfig config) : _config(std::move(config)) { _config.validate(); }

Router::Router(Router&&) noexcept = default;
Router& Router::operator=(Router&&) noexcept = default;

Router::Router(const Router& other) : _config(other._config) { cloneRoutesFrom(other); }

Router& Router::operator=(const Router& other) {
  if (this != &other) {
    _config = other._config;
    cloneRoutesFrom(other);
  }
  return *this;
}

Router::~Router() = default;

void Router::cloneRoutesFrom(const Router& other) {
  clear();
  _routes.reserve(other._routes.size());
  for (const auto& pRoute : other._routes) {
    _routes.push_back(std::make_unique<const Route>(*pRoute));
  }
  // Rebuild the priority order by position, so that it exactly mirrors the source router.
  _matchOrder.reserve(other._matchOrder.size());
  for (const Route* pOtherRoute : other._matchOrder) {
    const auto it = std::ranges::find_if(other._routes, [pOtherRoute](const auto& ptr) { return ptr.get() == pOtherRoute; });
    _matchOrder.push_back(_routes[static_cast<std::size_t>(it - other._routes.begin())].get());
  }
}

void Router::clear() noexcept {
  _matchOrder.clear();
  _routes.clear();
}

const Route& Router::setPath(http::MethodBmp methods, std::string_view path, HandlerAdapter handler,
                             std::string_view name, int32_t priority) {
  if (methods == 0) {
    methods = _config.defaultMethods;
  }
  return addRoute(Route(JoinPaths(_config.prefix, path), std::move(handler), methods, priority, name));
}

const Route& Router::setPath(http::Method method, std::string_view path, HandlerAdapter handler,
                             std::string_view name, int32_t priority) {
  return setPath(static_cast<http::MethodBmp>(method), path, std::move(handler), name, priority);
}

const Route& Router::setPath(std::initializer_list<std::string_view> methodNames, std::string_view path,
                             HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(std::span<const std::string_view>(methodNames.begin(), methodNames.size()), path,
                 std::move(handler), name, priority);
}

const Route& Router::setPath(std::span<const std::string_view> methodNames, std::string_view path,
                             HandlerAdapter handler, std::string_view name, int32_t priority) {
  if (methodNames.empty()) {
    return setPath(_config.defaultMethods, path, std::move(handler), name, priority);
  }
  return addRoute(Route(JoinPaths(_config.prefix, path), std::move(handler), methodNames, priority, name));
}

const Route& Router::get(std::string_view path, HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(http::Method::GET, path, std::move(handler), name, priority);
}

const Route& Router::post(std::string_view path, HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(http::Method::POST, path, std::move(handler), name, priority);
}

const Route& Router::put(std::string_view path, HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(http::Method::PUT, path, std::move(handler), name, priority);
}

const Route& Router::del(std::string_view path, HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(http::Method::DELETE, path, std::move(handler), name, priority);
}

const Route& Router::patch(std::string_view path, HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(http::Method::PATCH, path, std::move(handler), name, priority);
}

const Route& Router::head(std::string_view path, HandlerAdapter handler, std::string_view name, int32_t priority) {
  return setPath(http::Method::HEAD, path, std::move(handler), name, priority);
}

const Route& Router::options(std::string_view path, HandlerAdapter handler, std::string_view name,
                             int32_t priority) {
  return setPath(http::Method::OPTIONS, path, std::move(handler), name, priority);
}

const Route& Router::addRoute(Route route) {
  for (const Route* pExisting : _matchOrder) {
    if (pExisting->path() == route.path() && pExisting->priority() == route.priority() &&
        (pExisting->methods() & route.methods()) != 0) {
      log::warn("Route {} is shadowed by already registered {}", route.str(), pExisting->str());
      break;
    }
  }

  _routes.push_back(std::make_unique<const Route>(std::move(route)));
  const Route& newRoute = *_routes.back();

  // Stable insertion: after all routes of higher or equal priority.
  const auto pos = std::upper_bound(
      _matchOrder.begin(), _matchOrder.end(), newRoute.priority(),
      [](int32_t priority, const Route* pRoute) { return priority > pRoute->priority(); });
  _matchOrder.insert(pos, &newRoute);

  log::debug("Registered {}", newRoute.str());
  return newRoute;
}

void Router::include(const Router& other, std::string_view prefix) {
  const std::string mountPrefix = JoinPaths(_config.prefix, prefix);

  // Build all routes first, so that a failing route leaves this router unchanged
  // and so that including a router into itself only copies its current routes.
  vector<Route> mounted;
  mounted.reserve(other._routes.size());
  for (const auto& pRoute : other._routes) {
    mounted.push_back(pRoute->withPrefix(mountPrefix));
  }
  for (Route& route : mounted) {
    addRoute(std::move(route));
  }
  log::debug("Included {} routes under '{}'", mounted.size(), mountPrefix);
}

Router::RoutingResult Router::matchImpl(std::string_view path, std::optional<http::Method> method) const {
  RoutingResult result;

  if (method) {
    for (const Route* pRoute : _matchOrder) {
      if (!pRoute->allows(*method)) {
        continue;
      }
      auto params = pRoute->matchesPath(path);
      if (params) {
        result.status = RoutingResult::Status::Found;
        result.route = pRoute;
        result.params = std::move(*params);
        return result;
      }
    }
  }

  // No route accepts this method for this path, tell apart 'not found' and 'method not allowed'.
  for (const Route* pRoute : _matchOrder) {
    if (method && pRoute->allows(*method)) {
      continue;
    }
    if (pRoute->matchesPath(path)) {
      result.allowedMethods |= pRoute->methods();
    }
  }
  if (result.allowedMethods != 0) {
    result.status = RoutingResult::Status::MethodNotAllowed;
  }
  return result;
}

Router::RoutingResult Router::match(std::string_view path, http::Method method) const {
  return matchImpl(path, method);
}

Router::RoutingResult Router::match(std::string_view path, std::string_view method) const {
  return matchImpl(path, http::MethodStrToOptEnum(method));
}

std::optional<Router::RouteMatch> Router::find(std::string_view path, http::Method method) const {
  RoutingResult result = match(path, method);
  if (!result.found()) {
    return std::nullopt;
  }
  return RouteMatch{result.route, std::move(result.params)};
}

std::optional<Router::RouteMatch> Router::find(std::string_view path, std::string_view method) const {
  RoutingResult result = match(path, method);
  if (!result.found()) {
    return std::nullopt;
  }
  return RouteMatch{result.route, std::move(result.params)};
}

http::MethodBmp Router::allowedMethods(std::string_view path) const {
  http::MethodBmp methods = 0;
  for (const Route* pRoute : _matchOrder) {
    if ((methods & pRoute->methods()) != pRoute->methods() && pRoute->matchesPath(path)) {
      methods |= pRoute->methods();
    }
  }
  return methods;
}

const Route* Router::findByName(std::string_view name) const noexcept {
  if (name.empty()) {
    return nullptr;
  }
  for (const auto& pRoute : _routes) {
    if (pRoute->name() == name) {
      return pRoute.get();
    }
  }
  return nullptr;
}

std::string Router::urlFor(std::string_view name, const PathParams& params) const {
  const Route* pRoute = findByName(name);
  if (pRoute == nullptr) {
    throw std::invalid_argument("No route named '" + std::string(name) + "'");
  }
  return pRoute->pattern().expand(params);
}

}  // namespace waypoint
