#include <waypoint/waypoint.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

using namespace waypoint;

namespace {

Router UsersRouter() {
  Router users;
  users.get("/", [](HttpRequest &) { return HttpResponse("all users\n"); }, "users");
  users.get("/{id:int}",
            HandlerAdapter(
                [](HttpRequest *, const PathParams &params) {
                  return HttpResponse("user #" + std::to_string(params.get<int64_t>("id")) + "\n");
                },
                {ParamBinding::Of<int64_t>("id")}, RequestSlot::None),
            "user");
  users.get("/{name}",
            HandlerAdapter(
                [](HttpRequest *, const PathParams &params) {
                  return HttpResponse("user named " + params.get<std::string>("name") + "\n");
                },
                {"name"}, RequestSlot::None),
            "user-by-name", -1);
  return users;
}

Router FilesRouter() {
  Router files;
  files.get("/{path:multipath}", HandlerAdapter(
                                     [](HttpRequest *, const PathParams &params) {
                                       return HttpResponse("file '" + params.get<std::string>("path") + "'\n");
                                     },
                                     {"path"}, RequestSlot::None));
  files.get("/by-id/{id:uuid}", HandlerAdapter(
                                    [](HttpRequest *, const PathParams &params) {
                                      return HttpResponse("file id " + params.get<Uuid>("id").str() + "\n");
                                    },
                                    {ParamBinding::Of<Uuid>("id")}, RequestSlot::None),
            {}, 10);
  return files;
}

}  // namespace

int main() {
  try {
    Router v1;
    v1.include(UsersRouter(), "/users");
    v1.include(FilesRouter(), "/files");

    App app(AppConfig{}.withLogLevel(log::level::warn), Router(RouterConfig{}.withPrefix("/api")));
    app.includeRouter(v1, "/v1");

    for (const Route *route : app.router().routesByPriority()) {
      std::cout << route->str() << '\n';
    }

    app.startup();

    for (std::string_view target : {"/api/v1/users", "/api/v1/users/42", "/api/v1/users/alice",
                                    "/api/v1/files/docs/readme.md", "/api/v1/files/",
                                    "/api/v1/files/by-id/123e4567-e89b-12d3-a456-426614174000", "/api/v2/users"}) {
      HttpRequest req(http::Method::GET, target);
      HttpResponse resp = app.handle(req);
      std::cout << target << " -> " << resp.status() << ' ' << resp.body();
      if (resp.body().empty() || resp.body().back() != '\n') {
        std::cout << '\n';
      }
    }

    PathParams params;
    params.add("id", int64_t{7});
    std::cout << "url for 'user': " << app.router().urlFor("user", params) << '\n';

    app.shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Application error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
