#include "waypoint/route.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "waypoint/handler-adapter.hpp"
#include "waypoint/http-method.hpp"
#include "waypoint/http-request.hpp"
#include "waypoint/http-response.hpp"
#include "waypoint/path-params.hpp"

namespace waypoint {

namespace {

HttpResponse OkHandler([[maybe_unused]] HttpRequest &req) { return HttpResponse(http::StatusCodeOK); }

HttpResponse UserHandler([[maybe_unused]] HttpRequest *req, const PathParams &params) {
  return HttpResponse("user " + std::to_string(params.get<int64_t>("id")));
}

HttpResponse FileHandler([[maybe_unused]] HttpRequest *req, const PathParams &params) {
  return HttpResponse(params.get<std::string>("p"));
}

std::string InvalidArgumentMessage(auto &&func) {
  try {
    func();
  } catch (const std::invalid_argument &ex) {
    return ex.what();
  }
  return {};
}

}  // namespace

TEST(RouteTest, DefaultsToGet) {
  Route route("/hello", OkHandler);
  EXPECT_EQ(route.methods(), static_cast<http::MethodBmp>(http::Method::GET));
  EXPECT_TRUE(route.allows(http::Method::GET));
  EXPECT_FALSE(route.allows(http::Method::POST));
  EXPECT_EQ(route.priority(), 0);
  EXPECT_TRUE(route.name().empty());
}

TEST(RouteTest, MethodNames) {
  Route route("/hello", OkHandler, {"GET", "POST"}, 3, "hello");
  EXPECT_EQ(route.methods(), http::Method::GET | http::Method::POST);
  EXPECT_EQ(route.priority(), 3);
  EXPECT_EQ(route.name(), "hello");
  EXPECT_EQ(route.str(), "<Route GET,POST /hello priority=3>");
}

TEST(RouteTest, InvalidMethodNames) {
  EXPECT_THROW(Route("/hello", OkHandler, {"GET", "FETCH"}), std::invalid_argument);
  EXPECT_THROW(Route("/hello", OkHandler, {""}), std::invalid_argument);
  EXPECT_THROW(Route("/hello", OkHandler, {"get"}), std::invalid_argument);
  EXPECT_EQ(InvalidArgumentMessage([] { Route("/hello", OkHandler, {"FETCH", "GET", "PULL"}); }),
            "Invalid HTTP methods: 'FETCH', 'PULL'");
}

TEST(RouteTest, TemplateIsNormalized) {
  Route route("/a/b/", OkHandler);
  EXPECT_EQ(route.path(), "/a/b");
  EXPECT_EQ(route.str(), "<Route GET /a/b>");
}

TEST(RouteTest, MissingHandlerBinding) {
  const std::string msg =
      InvalidArgumentMessage([] { Route("/users/{id:int}/posts/{post}", HandlerAdapter(UserHandler, {"id"})); });
  EXPECT_NE(msg.find("[post]"), std::string::npos);
  EXPECT_NE(msg.find("does not bind"), std::string::npos);
}

TEST(RouteTest, ExtraHandlerBinding) {
  const std::string msg =
      InvalidArgumentMessage([] { Route("/users/{id:int}", HandlerAdapter(UserHandler, {"id", "extra"})); });
  EXPECT_NE(msg.find("[extra]"), std::string::npos);
  EXPECT_NE(msg.find("only defines [id]"), std::string::npos);
}

TEST(RouteTest, PlainHandlerOnParameterizedRouteIsRejected) {
  EXPECT_THROW(Route("/users/{id}", OkHandler), std::invalid_argument);
}

TEST(RouteTest, RequestIsNotAParameterName) {
  EXPECT_THROW(Route("/users/{request}", HandlerAdapter(UserHandler, {})), std::invalid_argument);
}

TEST(RouteTest, DeclaredTypeMustAgreeWithKind) {
  EXPECT_NO_THROW(Route("/users/{id:int}", HandlerAdapter(UserHandler, {ParamBinding::Of<int64_t>("id")})));
  EXPECT_NO_THROW(Route("/files/{p:multipath}", HandlerAdapter(FileHandler, {ParamBinding::Of<std::string>("p")})));
  EXPECT_EQ(InvalidArgumentMessage(
                [] { Route("/users/{id:int}", HandlerAdapter(UserHandler, {ParamBinding::Of<std::string>("id")})); }),
            "Parameter 'id' type mismatch: route expects integer (int) but handler declares string");
}

TEST(RouteTest, MatchesChecksMethodFirst) {
  Route route("/users/{id:int}", HandlerAdapter(UserHandler, {"id"}), http::Method::GET | http::Method::PUT);
  auto params = route.matches("/users/12", http::Method::PUT);
  ASSERT_TRUE(params);
  EXPECT_EQ(params->get<int64_t>("id"), 12);
  EXPECT_FALSE(route.matches("/users/12", http::Method::DELETE).has_value());
  EXPECT_TRUE(route.matchesPath("/users/12").has_value());
}

TEST(RouteTest, TrailingSlashOfRequestIsIgnored) {
  Route route("/a/b", OkHandler);
  EXPECT_TRUE(route.matchesPath("/a/b").has_value());
  EXPECT_TRUE(route.matchesPath("/a/b/").has_value());
  EXPECT_FALSE(route.matchesPath("/a/b/c").has_value());
  EXPECT_FALSE(route.matchesPath("/a").has_value());
}

TEST(RouteTest, ConversionFailureIsNoMatch) {
  Route route("/users/{id:int}", HandlerAdapter(UserHandler, {"id"}));
  EXPECT_FALSE(route.matchesPath("/users/abc").has_value());
  EXPECT_FALSE(route.matchesPath("/users/123456789012345678901234567890").has_value());
}

TEST(RouteTest, MultiSegmentMatchesRawPathFirst) {
  Route route("/files/{p:multipath}", HandlerAdapter(FileHandler, {"p"}));

  auto params = route.matchesPath("/files/a/b/c");
  ASSERT_TRUE(params);
  EXPECT_EQ(params->get<std::string>("p"), "a/b/c");

  params = route.matchesPath("/files/");
  ASSERT_TRUE(params);
  EXPECT_EQ(params->get<std::string>("p"), "");

  // Raw path keeps the trailing slash in the capture.
  params = route.matchesPath("/files/a/b/");
  ASSERT_TRUE(params);
  EXPECT_EQ(params->get<std::string>("p"), "a/b/");

  EXPECT_FALSE(route.matchesPath("/files").has_value());
  EXPECT_FALSE(route.matchesPath("/other/a").has_value());
}

TEST(RouteTest, HandleUsesRequestPathParams) {
  Route route("/users/{id:int}", HandlerAdapter(UserHandler, {"id"}));
  HttpRequest request(http::Method::GET, "/users/7");
  auto params = route.matchesPath(request.path());
  ASSERT_TRUE(params);
  request.setPathParams(*params);
  EXPECT_EQ(route.handle(request).body(), "user 7");
  EXPECT_EQ(route.handle(request, *params).body(), "user 7");
}

TEST(RouteTest, WithPrefix) {
  Route route("/users/{id:int}", HandlerAdapter(UserHandler, {"id"}),
              static_cast<http::MethodBmp>(http::Method::POST), 4, "user");
  Route prefixed = route.withPrefix("/api/v1/");
  EXPECT_EQ(prefixed.path(), "/api/v1/users/{id:int}");
  EXPECT_EQ(prefixed.methods(), route.methods());
  EXPECT_EQ(prefixed.priority(), 4);
  EXPECT_EQ(prefixed.name(), "user");
  EXPECT_TRUE(prefixed.matchesPath("/api/v1/users/3").has_value());
  EXPECT_FALSE(prefixed.matchesPath("/users/3").has_value());

  EXPECT_EQ(Route("/", OkHandler).withPrefix("/api").path(), "/api");
}

}  // namespace waypoint
