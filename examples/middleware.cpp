#include <waypoint/waypoint.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace waypoint;

namespace {

// Logs the duration of each request, including requests whose handler throws.
class RequestTimer {
 public:
  explicit RequestTimer(const HttpRequest &req) : _req(req), _start(std::chrono::steady_clock::now()) {}

  RequestTimer(const RequestTimer &) = delete;
  RequestTimer &operator=(const RequestTimer &) = delete;

  ~RequestTimer() {
    const auto elapsed = std::chrono::steady_clock::now() - _start;
    log::info("{} {} served in {} us", http::MethodToStr(_req.method()), _req.path(),
              std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
  }

 private:
  const HttpRequest &_req;
  std::chrono::steady_clock::time_point _start;
};

void Print(App &app, HttpRequest req) {
  HttpResponse resp = app.handle(req);
  std::cout << http::MethodToStr(req.method()) << ' ' << req.path() << " -> " << resp.status() << ' '
            << resp.reason();
  if (auto allow = resp.headerValue(http::Allow)) {
    std::cout << " (Allow: " << *allow << ')';
  }
  std::cout << '\n' << resp.body() << '\n';
}

}  // namespace

int main() {
  try {
    App app(AppConfig{}.withLogLevel(log::level::info));

    // Outermost layer: timing
    app.addMiddleware([](HttpRequest &req, const RequestHandler &next) {
      RequestTimer timer(req);
      return next(req);
    });

    // Authorization check: short-circuits without calling the inner layers
    app.addMiddleware([](HttpRequest &req, const RequestHandler &next) {
      if (req.path().starts_with("/admin") && req.headerValueOrEmpty("Authorization") != "Bearer admin") {
        return HttpResponse(http::StatusCodeUnauthorized).body("Unauthorized\n");
      }
      return next(req);
    });

    // Response decoration
    app.addMiddleware([](HttpRequest &req, const RequestHandler &next) {
      return next(req).header("X-Powered-By", "waypoint");
    });

    app.get("/admin/stats", [](HttpRequest &) { return HttpResponse("42 requests\n"); });
    app.get("/fail", [](HttpRequest &) -> HttpResponse { throw std::runtime_error("database unavailable"); });
    app.post("/items", [](HttpRequest &req) {
      return HttpResponse(http::StatusCodeCreated).body(std::string(req.body()), http::ContentTypeApplicationJson);
    });

    app.onStartup([] { log::info("Starting up"); });
    app.onShutdown([] { log::info("Shutting down"); });

    app.startup();

    Print(app, HttpRequest(http::Method::GET, "/admin/stats"));
    Print(app, HttpRequest(http::Method::GET, "/admin/stats").header("Authorization", "Bearer admin"));
    Print(app, HttpRequest(http::Method::POST, "/items", R"({"name":"pen"})"));
    Print(app, HttpRequest(http::Method::GET, "/items"));
    Print(app, HttpRequest(http::Method::GET, "/fail"));

    app.shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Application error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
