#include <waypoint/waypoint.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

using namespace waypoint;

int main(int argc, char **argv) {
  std::string_view target = "/hello/world";
  if (argc > 1) {
    target = argv[1];
  }

  try {
    App app;

    app.get("/", [](HttpRequest &) { return HttpResponse("Hello from waypoint!\n"); });

    app.get("/hello/{name}", HandlerAdapter(
                                 [](HttpRequest *req, const PathParams &params) {
                                   HttpResponse resp(http::StatusCodeOK);
                                   resp.appendBody("Hello ");
                                   resp.appendBody(params.get<std::string>("name"));
                                   resp.appendBody("! You requested ");
                                   resp.appendBody(req->path());
                                   resp.appendBody(" with method ");
                                   resp.appendBody(http::MethodToStr(req->method()));
                                   resp.appendBody("\n");
                                   return resp;
                                 },
                                 {"name"}));

    app.startup();

    HttpRequest req(http::Method::GET, target);
    HttpResponse resp = app.handle(req);
    std::cout << resp.status() << ' ' << resp.reason() << '\n' << resp.body();

    app.shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Application error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
