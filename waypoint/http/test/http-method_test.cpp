#include "waypoint/http-method.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "waypoint/ascii.hpp"
#include "waypoint/http-method-parse.hpp"

namespace {

using waypoint::http::IsMethodSet;
using waypoint::http::Method;
using waypoint::http::MethodBmp;
using waypoint::http::MethodBmpToStr;
using waypoint::http::MethodFromIdx;
using waypoint::http::MethodStrToOptEnum;
using waypoint::http::MethodStrToOptEnumStrict;
using waypoint::http::MethodToIdx;
using waypoint::http::MethodToStr;

struct MethodCase {
  Method method;
  std::string_view token;
};

constexpr std::array<MethodCase, waypoint::http::kNbMethods> kMethodCases = {{{Method::GET, "GET"},
                                                                              {Method::HEAD, "HEAD"},
                                                                              {Method::POST, "POST"},
                                                                              {Method::PUT, "PUT"},
                                                                              {Method::DELETE, "DELETE"},
                                                                              {Method::OPTIONS, "OPTIONS"},
                                                                              {Method::PATCH, "PATCH"}}};

std::string AlternateCase(std::string_view token) {
  std::string mixed(token);
  for (std::size_t pos = 0; pos < mixed.size(); pos += 2) {
    mixed[pos] = waypoint::tolower(mixed[pos]);
  }
  return mixed;
}

}  // namespace

TEST(HttpMethod, IdxRoundTrip) {
  for (const auto &methodCase : kMethodCases) {
    EXPECT_EQ(MethodFromIdx(MethodToIdx(methodCase.method)), methodCase.method);
    EXPECT_EQ(MethodToStr(methodCase.method), methodCase.token);
  }
}

TEST(HttpMethod, ParseCaseInsensitive) {
  for (const auto &methodCase : kMethodCases) {
    EXPECT_EQ(MethodStrToOptEnum(methodCase.token), methodCase.method);
    EXPECT_EQ(MethodStrToOptEnum(AlternateCase(methodCase.token)), methodCase.method);
  }
  EXPECT_FALSE(MethodStrToOptEnum("").has_value());
  EXPECT_FALSE(MethodStrToOptEnum("GETS").has_value());
  EXPECT_FALSE(MethodStrToOptEnum("TRACE").has_value());
  EXPECT_FALSE(MethodStrToOptEnum("CONNECT").has_value());
}

TEST(HttpMethod, ParseStrict) {
  for (const auto &methodCase : kMethodCases) {
    EXPECT_EQ(MethodStrToOptEnumStrict(methodCase.token), methodCase.method);
    EXPECT_FALSE(MethodStrToOptEnumStrict(AlternateCase(methodCase.token)).has_value());
  }
  EXPECT_FALSE(MethodStrToOptEnumStrict("").has_value());
  EXPECT_FALSE(MethodStrToOptEnumStrict("FETCH").has_value());
}

TEST(HttpMethod, Bitmap) {
  const MethodBmp bmp = Method::GET | Method::DELETE | Method::PATCH;
  EXPECT_TRUE(IsMethodSet(bmp, Method::GET));
  EXPECT_TRUE(IsMethodSet(bmp, Method::DELETE));
  EXPECT_FALSE(IsMethodSet(bmp, Method::POST));
  EXPECT_EQ(MethodBmpToStr(bmp), "GET, DELETE, PATCH");
  EXPECT_EQ(MethodBmpToStr(bmp, ","), "GET,DELETE,PATCH");
  EXPECT_EQ(MethodBmpToStr(0), "");
  EXPECT_EQ(MethodBmpToStr(waypoint::http::kAllMethods), "GET, HEAD, POST, PUT, DELETE, OPTIONS, PATCH");
}
