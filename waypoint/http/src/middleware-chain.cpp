#include "waypoint/middleware-chain.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/log.hpp"
#include "waypoint/middleware.hpp"

namespace waypoint {

namespace {

// One layer of the onion: a middleware and the (owned) rest of the pipeline.
class MiddlewareLayer {
 public:
  MiddlewareLayer(Middleware middleware, RequestHandler next)
      : _middleware(std::move(middleware)), _next(std::move(next)) {}

  HttpResponse operator()(HttpRequest& request) const { return _middleware(request, _next); }

 private:
  Middleware _middleware;
  RequestHandler _next;
};

}  // namespace

HttpResponse ComposedHandler::operator()(HttpRequest& request) const {
  if (!_pipeline) {
    throw std::logic_error("Cannot invoke an empty composed handler");
  }
  return (*_pipeline)(request);
}

MiddlewareChain& MiddlewareChain::add(Middleware middleware) {
  if (!middleware) {
    throw std::invalid_argument("Middleware must be callable");
  }
  if (isBuilt()) {
    throw std::logic_error("Cannot add middleware after the chain has been built");
  }
  _middlewares.push_back(std::move(middleware));
  return *this;
}

ComposedHandler MiddlewareChain::build(RequestHandler terminal) {
  if (isBuilt()) {
    log::warn("Middleware chain already built, ignoring new terminal handler");
    return _composed;
  }
  if (!terminal) {
    throw std::invalid_argument("Terminal handler must be callable");
  }

  RequestHandler pipeline = std::move(terminal);
  for (auto idx = _middlewares.size(); idx != 0; --idx) {
    pipeline = MiddlewareLayer(_middlewares[idx - 1U], std::move(pipeline));
  }

  _composed = ComposedHandler(std::make_shared<const RequestHandler>(std::move(pipeline)));
  log::debug("Middleware chain built with {} layer(s)", _middlewares.size());
  return _composed;
}

}  // namespace waypoint
