#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/route.hpp"
#include "waypoint/router-config.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// Ordered collection of Routes.
//
// Routes are tried by descending priority; routes of equal priority are tried in registration
// order. This order is established when routes are added, not at lookup time.
//
// Threading / lifetime:
//   - Routes are registered (setPath, include) during single threaded application setup.
//   - Once setup is over, match() and find() are const and only allocate request scoped state,
//     so a Router can be shared by concurrent requests.
//   - Route references returned by setPath() and Route pointers in match results stay valid as
//     long as the Router is alive and not cleared, including after further registrations.
class Router {
 public:
  struct RoutingResult {
    enum class Status : std::uint8_t {
      Found,            // a route matched both the path and the method
      NotFound,         // no route pattern matches the path
      MethodNotAllowed  // some route patterns match the path but none allows the method
    };

    [[nodiscard]] bool found() const noexcept { return status == Status::Found; }

    Status status{Status::NotFound};

    // Matched route, nullptr unless status is Found.
    const Route* route{nullptr};

    // Converted path parameters of the matched route.
    PathParams params;

    // When status is MethodNotAllowed, the union of the methods of the routes matching the path.
    http::MethodBmp allowedMethods{0};
  };

  struct RouteMatch {
    const Route* route;
    PathParams params;
  };

  using RouteRange = std::span<const std::unique_ptr<const Route>>;

  // Creates an empty Router with no prefix and GET as default method.
  Router() = default;

  // Creates an empty Router with the given configuration. The configuration is validated.
  explicit Router(RouterConfig config);

  // Copy operations duplicate the router state including all registered routes.
  Router(const Router& other);
  Router& operator=(const Router& other);

  Router(Router&&) noexcept;
  Router& operator=(Router&&) noexcept;

  ~Router();

  // Register a handler for a path template and a set of allowed HTTP methods.
  // An empty method set means the router's default methods (GET unless configured otherwise).
  // The router prefix, if any, is prepended to the template.
  // Template syntax is described in PathPattern. Examples:
  // - "/users/{userId:int}/posts/{post}" matches "/users/42/posts/foo" with userId=42 and post="foo"
  // - "/files/{path:multipath}" matches "/files/a/b/c" with path="a/b/c" and "/files/" with path=""
  // Throws std::invalid_argument for any configuration error (see Route).
  const Route& setPath(http::MethodBmp methods, std::string_view path, HandlerAdapter handler,
                       std::string_view name = {}, int32_t priority = 0);

  const Route& setPath(http::Method method, std::string_view path, HandlerAdapter handler,
                       std::string_view name = {}, int32_t priority = 0);

  // Same as above, with method names ("GET", "POST", ...), which should be upper case.
  const Route& setPath(std::initializer_list<std::string_view> methodNames, std::string_view path,
                       HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);

  const Route& setPath(std::span<const std::string_view> methodNames, std::string_view path, HandlerAdapter handler,
                       std::string_view name = {}, int32_t priority = 0);

  // Single method shortcuts.
  const Route& get(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);
  const Route& post(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);
  const Route& put(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);
  const Route& del(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);
  const Route& patch(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);
  const Route& head(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0);
  const Route& options(std::string_view path, HandlerAdapter handler, std::string_view name = {},
                       int32_t priority = 0);

  // Copies every route currently held by 'other' (in its registration order) into this router,
  // mounted under 'prefix' and under this router's own prefix.
  // This is a one time structural copy: routes added to 'other' afterwards are not visible here.
  // A router that already includes other routers can itself be included.
  void include(const Router& other, std::string_view prefix = {});

  // Match the provided 'path' for 'method'.
  // Routes whose parameters cannot be converted (for instance an int overflowing int64_t) are
  // skipped, and the next candidate is tried. Never throws for a well formed call.
  [[nodiscard]] RoutingResult match(std::string_view path, http::Method method) const;

  // Same as above, with the method name, parsed case-insensitively.
  // An unknown method name behaves like a method allowed by no route.
  [[nodiscard]] RoutingResult match(std::string_view path, std::string_view method) const;

  // Returns the first route (by priority) matching 'path' and 'method', with its converted
  // parameters, or std::nullopt.
  [[nodiscard]] std::optional<RouteMatch> find(std::string_view path, http::Method method) const;

  [[nodiscard]] std::optional<RouteMatch> find(std::string_view path, std::string_view method) const;

  // Return a bitmap of the methods of all routes whose pattern matches 'path'.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  // Returns the first registered route with given name, or nullptr.
  [[nodiscard]] const Route* findByName(std::string_view name) const noexcept;

  // Builds the concrete path of the route named 'name' with given parameter values.
  // Throws std::invalid_argument if there is no such route or if a parameter is missing.
  [[nodiscard]] std::string urlFor(std::string_view name, const PathParams& params) const;

  // Routes in registration order.
  [[nodiscard]] RouteRange routes() const noexcept { return _routes; }

  // Routes in matching order (descending priority, then registration order).
  [[nodiscard]] std::span<const Route* const> routesByPriority() const noexcept { return _matchOrder; }

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Clear all registered routes. The configuration stays unchanged.
  void clear() noexcept;

 private:
  const Route& addRoute(Route route);

  RoutingResult matchImpl(std::string_view path, std::optional<http::Method> method) const;

  void cloneRoutesFrom(const Router& other);

  RouterConfig _config;
  vector<std::unique_ptr<const Route>> _routes;
  vector<const Route*> _matchOrder;
};

}  // namespace waypoint
