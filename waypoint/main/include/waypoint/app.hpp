#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

#include "waypoint/app-config.hpp"
#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/middleware-chain.hpp"
#include "waypoint/middleware.hpp"
#include "waypoint/route.hpp"
#include "waypoint/router.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

using LifecycleHook = std::function<void()>;

// Application object tying a Router, a middleware chain and lifecycle hooks together.
//
// Typical usage:
//   App app;
//   app.get("/hello", [](HttpRequest&) { return HttpResponse("hello"); });
//   app.addMiddleware(...);
//   app.startup();
//   HttpResponse resp = app.handle(request);
//   app.shutdown();
//
// The middleware chain is composed around the router dispatcher on the first startup() and is
// frozen afterwards. Routes may still be added after startup.
// An App cannot be copied nor moved, as its composed pipeline refers to it.
class App {
 public:
  // Validates 'config' and applies its log level.
  explicit App(AppConfig config = {}, Router router = {});

  App(const App&) = delete;
  App(App&&) = delete;
  App& operator=(const App&) = delete;
  App& operator=(App&&) = delete;

  ~App() = default;

  [[nodiscard]] Router& router() noexcept { return _router; }
  [[nodiscard]] const Router& router() const noexcept { return _router; }

  [[nodiscard]] const AppConfig& config() const noexcept { return _config; }

  // Copies the routes of 'router' under 'prefix' (see Router::include).
  void includeRouter(const Router& router, std::string_view prefix = {});

  const Route& route(http::MethodBmp methods, std::string_view path, HandlerAdapter handler,
                     std::string_view name = {}, int32_t priority = 0) {
    return _router.setPath(methods, path, std::move(handler), name, priority);
  }

  const Route& get(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0) {
    return _router.get(path, std::move(handler), name, priority);
  }
  const Route& post(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0) {
    return _router.post(path, std::move(handler), name, priority);
  }
  const Route& put(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0) {
    return _router.put(path, std::move(handler), name, priority);
  }
  const Route& del(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0) {
    return _router.del(path, std::move(handler), name, priority);
  }
  const Route& patch(std::string_view path, HandlerAdapter handler, std::string_view name = {},
                     int32_t priority = 0) {
    return _router.patch(path, std::move(handler), name, priority);
  }
  const Route& head(std::string_view path, HandlerAdapter handler, std::string_view name = {}, int32_t priority = 0) {
    return _router.head(path, std::move(handler), name, priority);
  }
  const Route& options(std::string_view path, HandlerAdapter handler, std::string_view name = {},
                       int32_t priority = 0) {
    return _router.options(path, std::move(handler), name, priority);
  }

  // Appends a middleware. The first added is the outermost layer.
  // Throws std::logic_error once the App has been started.
  App& addMiddleware(Middleware middleware);

  App& onStartup(LifecycleHook hook);

  App& onShutdown(LifecycleHook hook);

  // Same as onStartup / onShutdown with the event name "startup" or "shutdown".
  // Throws std::invalid_argument for any other event name.
  App& addEventHandler(std::string_view eventName, LifecycleHook hook);

  // Composes the middleware chain (on first call only) and runs the startup hooks in order.
  // Throws std::logic_error if already started.
  void startup();

  // Runs the shutdown hooks in order. No-op if not started.
  void shutdown();

  [[nodiscard]] bool isStarted() const noexcept { return _started; }

  // Runs 'request' through the middleware chain and the router.
  // Exceptions escaping the pipeline are logged and turned into a 500 response.
  // Throws std::logic_error if the App is not started.
  HttpResponse handle(HttpRequest& request) const;

 private:
  HttpResponse dispatch(HttpRequest& request) const;

  AppConfig _config;
  Router _router;
  MiddlewareChain _middlewareChain;
  ComposedHandler _pipeline;
  vector<LifecycleHook> _startupHooks;
  vector<LifecycleHook> _shutdownHooks;
  bool _started{false};
};

}  // namespace waypoint
