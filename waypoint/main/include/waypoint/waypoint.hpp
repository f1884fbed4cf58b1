// waypoint Umbrella Header
//
// Include this single header to pull in the public routing API:
//   - App and AppConfig
//   - Router, RouterConfig, Route and PathPattern
//   - HandlerAdapter and parameter bindings
//   - Middleware and MiddlewareChain
//   - Request / Response primitives and HTTP helpers (methods, status codes)
//
// Each re-exported header line is annotated with IWYU pragma: export so that users only including
// <waypoint/waypoint.hpp> can use the symbols directly.
//
// Usage Example:
//    #include <waypoint/waypoint.hpp>
//    using namespace waypoint;
//    int main() {
//      App app;
//      app.get("/hello", [](HttpRequest&) { return HttpResponse("hi\n"); });
//      app.startup();
//      HttpRequest req(http::Method::GET, "/hello");
//      HttpResponse resp = app.handle(req);
//    }
#pragma once

// IWYU pragma: begin_exports
#include "waypoint/app-config.hpp"
#include "waypoint/app.hpp"
#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-constants.hpp"
#include "waypoint/http-method-parse.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/http-status-code.hpp"
#include "waypoint/middleware-chain.hpp"
#include "waypoint/middleware.hpp"
#include "waypoint/path-params.hpp"
#include "waypoint/path-pattern.hpp"
#include "waypoint/route.hpp"
#include "waypoint/router-config.hpp"
#include "waypoint/router.hpp"
#include "waypoint/uuid.hpp"
// IWYU pragma: end_exports
