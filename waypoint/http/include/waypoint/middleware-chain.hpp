#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/middleware.hpp"
#include "waypoint/vector.hpp"

namespace waypoint {

// Result of MiddlewareChain::build: the request handler with all middleware layers applied.
// Cheap to copy, all copies share the same immutable pipeline.
class ComposedHandler {
 public:
  // An empty handler. Invoking it throws std::logic_error.
  ComposedHandler() noexcept = default;

  HttpResponse operator()(HttpRequest& request) const;

  explicit operator bool() const noexcept { return static_cast<bool>(_pipeline); }

  bool operator==(const ComposedHandler&) const noexcept = default;

 private:
  friend class MiddlewareChain;

  explicit ComposedHandler(std::shared_ptr<const RequestHandler> pipeline) noexcept
      : _pipeline(std::move(pipeline)) {}

  std::shared_ptr<const RequestHandler> _pipeline;
};

// Ordered list of middleware folded around a terminal handler.
// The first added middleware is the outermost layer: with middleware A, B, C added in this order,
// a request goes through A, B, C, the terminal handler, then back through C, B and A.
// The chain is frozen once built.
class MiddlewareChain {
 public:
  // Appends a middleware.
  // Throws std::invalid_argument if 'middleware' is empty, std::logic_error if the chain is built.
  MiddlewareChain& add(Middleware middleware);

  // Composes all middleware around 'terminal' and freezes the chain.
  // Throws std::invalid_argument if 'terminal' is empty.
  // Subsequent calls return the handler composed by the first call, ignoring 'terminal'.
  ComposedHandler build(RequestHandler terminal);

  [[nodiscard]] std::size_t count() const noexcept { return _middlewares.size(); }

  [[nodiscard]] bool isBuilt() const noexcept { return static_cast<bool>(_composed); }

 private:
  vector<Middleware> _middlewares;
  ComposedHandler _composed;
};

}  // namespace waypoint
