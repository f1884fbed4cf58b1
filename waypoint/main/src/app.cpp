#include "waypoint/app.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "waypoint/app-config.hpp"
#include "waypoint/http-constants.hpp"
#include "waypoint/http-method-parse.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/http-status-code.hpp"
#include "waypoint/log.hpp"
#include "waypoint/middleware.hpp"
#include "waypoint/router.hpp"

namespace waypoint {

App::App(AppConfig config, Router router) : _config(std::move(config)), _router(std::move(router)) {
  _config.validate();
  if (_config.logLevel) {
    log::set_level(*_config.logLevel);
  }
}

void App::includeRouter(const Router& router, std::string_view prefix) { _router.include(router, prefix); }

App& App::addMiddleware(Middleware middleware) {
  if (_started || _middlewareChain.isBuilt()) {
    throw std::logic_error("Cannot add middleware after the application has started");
  }
  _middlewareChain.add(std::move(middleware));
  return *this;
}

App& App::onStartup(LifecycleHook hook) {
  if (!hook) {
    throw std::invalid_argument("Startup hook must be callable");
  }
  _startupHooks.push_back(std::move(hook));
  return *this;
}

App& App::onShutdown(LifecycleHook hook) {
  if (!hook) {
    throw std::invalid_argument("Shutdown hook must be callable");
  }
  _shutdownHooks.push_back(std::move(hook));
  return *this;
}

App& App::addEventHandler(std::string_view eventName, LifecycleHook hook) {
  if (eventName == "startup") {
    return onStartup(std::move(hook));
  }
  if (eventName == "shutdown") {
    return onShutdown(std::move(hook));
  }
  throw std::invalid_argument("Unknown event '" + std::string(eventName) + "', expected 'startup' or 'shutdown'");
}

void App::startup() {
  if (_started) {
    throw std::logic_error("Application is already started");
  }
  if (!_pipeline) {
    _pipeline = _middlewareChain.build([this](HttpRequest& request) { return dispatch(request); });
  }
  for (const auto& hook : _startupHooks) {
    hook();
  }
  _started = true;
  log::info("Application started with {} route(s) and {} middleware(s)", _router.size(), _middlewareChain.count());
}

void App::shutdown() {
  if (!_started) {
    return;
  }
  _started = false;
  for (const auto& hook : _shutdownHooks) {
    hook();
  }
  log::info("Application stopped");
}

HttpResponse App::dispatch(HttpRequest& request) const {
  Router::RoutingResult result = _router.match(request.path(), request.method());
  switch (result.status) {
    case Router::RoutingResult::Status::Found:
      request.setPathParams(std::move(result.params));
      return result.route->handle(request);
    case Router::RoutingResult::Status::MethodNotAllowed:
      return HttpResponse(http::StatusCodeMethodNotAllowed)
          .header(http::Allow, http::MethodBmpToStr(result.allowedMethods))
          .body(std::string(http::ReasonPhraseFor(http::StatusCodeMethodNotAllowed)));
    default:
      return HttpResponse(http::StatusCodeNotFound).body(std::string(http::ReasonPhraseFor(http::StatusCodeNotFound)));
  }
}

HttpResponse App::handle(HttpRequest& request) const {
  if (!_started) {
    throw std::logic_error("Application must be started before handling requests");
  }
  try {
    return _pipeline(request);
  } catch (const std::exception& ex) {
    log::error("Unhandled exception for {} {}: {}", http::MethodToStr(request.method()), request.path(), ex.what());
    std::string body(http::ReasonPhraseFor(http::StatusCodeInternalServerError));
    if (_config.exposeErrorDetails) {
      body.append(": ");
      body.append(ex.what());
    }
    return HttpResponse(http::StatusCodeInternalServerError).body(std::move(body));
  }
}

}  // namespace waypoint
