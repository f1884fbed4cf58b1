#pragma once

#include <functional>

#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"

namespace waypoint {

// Innermost handler of a request pipeline, typically the router dispatcher.
using RequestHandler = std::function<HttpResponse(HttpRequest&)>;

// Middleware wrapping the rest of the pipeline.
// It may mutate the request, then either call 'next' (possibly amending the returned response)
// or return its own response without calling 'next' to short-circuit the inner layers.
// Exceptions thrown by 'next' propagate to the middleware, which may catch or let them through.
using Middleware = std::function<HttpResponse(HttpRequest&, const RequestHandler& next)>;

}  // namespace waypoint
