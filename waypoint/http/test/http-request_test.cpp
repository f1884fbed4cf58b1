#include "waypoint/http-request.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "waypoint/http-method.hpp"
#include "waypoint/path-params.hpp"

namespace waypoint {

TEST(HttpRequestTest, TargetIsSplit) {
  HttpRequest request(http::Method::POST, "/search?q=abc&page=2", "payload");
  EXPECT_EQ(request.method(), http::Method::POST);
  EXPECT_EQ(request.path(), "/search");
  EXPECT_EQ(request.queryString(), "q=abc&page=2");
  EXPECT_EQ(request.body(), "payload");
}

TEST(HttpRequestTest, QueryParams) {
  HttpRequest request(http::Method::GET, "/search?name=John&age=30&city=NYC");
  ASSERT_EQ(request.queryParams().size(), 3U);
  EXPECT_EQ(request.queryParams()[0], (QueryParam{"name", "John"}));
  EXPECT_EQ(request.queryParamValue("name"), "John");
  EXPECT_EQ(request.queryParamValue("age"), "30");
  EXPECT_EQ(request.queryParamValue("missing"), std::nullopt);
  EXPECT_EQ(request.queryParamValue("missing").value_or("default"), "default");
}

TEST(HttpRequestTest, NoQueryParams) {
  HttpRequest request(http::Method::GET, "/search");
  EXPECT_TRUE(request.queryParams().empty());
  EXPECT_TRUE(request.queryParamValues("any").empty());

  EXPECT_TRUE(HttpRequest(http::Method::GET, "/search?").queryParams().empty());
  EXPECT_TRUE(HttpRequest(http::Method::GET, "/search?&&").queryParams().empty());
}

TEST(HttpRequestTest, MultiValueQueryParams) {
  HttpRequest request(http::Method::GET, "/?page=1&tags=python&limit=10&tags=web");
  EXPECT_EQ(request.queryParamValue("tags"), "python");

  auto tags = request.queryParamValues("tags");
  ASSERT_EQ(tags.size(), 2U);
  EXPECT_EQ(tags[0], "python");
  EXPECT_EQ(tags[1], "web");

  auto pages = request.queryParamValues("page");
  ASSERT_EQ(pages.size(), 1U);
  EXPECT_EQ(pages[0], "1");
}

TEST(HttpRequestTest, QueryParamsAreUrlDecoded) {
  HttpRequest request(http::Method::GET, "/?q=hello+world&path=%2Fa%2Fb&first+name=J%C3%B6rg&pct=100%25&bad=%zz");
  EXPECT_EQ(request.queryParamValue("q"), "hello world");
  EXPECT_EQ(request.queryParamValue("path"), "/a/b");
  EXPECT_EQ(request.queryParamValue("first name"), "J\xC3\xB6rg");
  EXPECT_EQ(request.queryParamValue("pct"), "100%");
  EXPECT_EQ(request.queryParamValue("bad"), "%zz");
  // the raw query string is kept as received
  EXPECT_EQ(request.queryString(), "q=hello+world&path=%2Fa%2Fb&first+name=J%C3%B6rg&pct=100%25&bad=%zz");
}

TEST(HttpRequestTest, QueryParamsWithBlankValues) {
  HttpRequest request(http::Method::GET, "/?flag&empty=&eq=a=b");
  EXPECT_EQ(request.queryParamValue("flag"), "");
  EXPECT_EQ(request.queryParamValue("empty"), "");
  EXPECT_EQ(request.queryParamValue("eq"), "a=b");
}

TEST(HttpRequestTest, EmptyPathIsRoot) {
  EXPECT_EQ(HttpRequest(http::Method::GET, "").path(), "/");
  EXPECT_EQ(HttpRequest(http::Method::GET, "?x=1").path(), "/");
}

TEST(HttpRequestTest, Headers) {
  HttpRequest request = HttpRequest(http::Method::GET, "/").header("Content-Type", "text/plain").header("X-A", "1");
  EXPECT_EQ(request.headers().size(), 2U);
  EXPECT_EQ(request.headerValueOrEmpty("content-type"), "text/plain");
  request.header("x-a", "2");
  EXPECT_EQ(request.headers().size(), 2U);
  EXPECT_EQ(request.headerValue("X-A"), "2");
  EXPECT_FALSE(request.headerValue("Accept").has_value());
  EXPECT_EQ(request.headerValueOrEmpty("Accept"), "");
}

TEST(HttpRequestTest, PathParams) {
  HttpRequest request(http::Method::GET, "/users/3");
  EXPECT_TRUE(request.pathParams().empty());

  PathParams params;
  params.add("id", int64_t{3});
  request.setPathParams(params);
  EXPECT_EQ(request.pathParams().get<int64_t>("id"), 3);
}

}  // namespace waypoint
