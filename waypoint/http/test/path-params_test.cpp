#include "waypoint/path-params.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

#include "waypoint/uuid.hpp"

namespace waypoint {

TEST(PathParamsTest, KindNames) {
  EXPECT_EQ(ParamKindToStr(ParamKind::String), "str");
  EXPECT_EQ(ParamKindToStr(ParamKind::MultiSegment), "multipath");
  EXPECT_EQ(ParamKindFromStr("int"), ParamKind::Integer);
  EXPECT_EQ(ParamKindFromStr("float"), ParamKind::Float);
  EXPECT_EQ(ParamKindFromStr("uuid"), ParamKind::Uuid);
  EXPECT_FALSE(ParamKindFromStr("path").has_value());
  EXPECT_FALSE(ParamKindFromStr("INT").has_value());
}

TEST(PathParamsTest, AddAndGet) {
  PathParams params;
  EXPECT_TRUE(params.empty());

  params.add("name", std::string("john"));
  params.add("id", int64_t{42});
  params.add("ratio", 0.5);

  ASSERT_EQ(params.size(), 3U);
  EXPECT_EQ(params[0].name, "name");
  EXPECT_TRUE(params.contains("id"));
  EXPECT_FALSE(params.contains("other"));

  EXPECT_EQ(params.get<std::string>("name"), "john");
  EXPECT_EQ(params.get<int64_t>("id"), 42);
  EXPECT_DOUBLE_EQ(params.get<double>("ratio"), 0.5);

  EXPECT_EQ(params.getIf<double>("id"), nullptr);
  EXPECT_EQ(params.getIf<int64_t>("missing"), nullptr);

  EXPECT_THROW((void)params.get<int64_t>("missing"), std::out_of_range);
  EXPECT_THROW((void)params.get<std::string>("id"), std::bad_variant_access);

  std::size_t nbParams = 0;
  for (const PathParam &param : params) {
    EXPECT_FALSE(param.name.empty());
    ++nbParams;
  }
  EXPECT_EQ(nbParams, 3U);

  params.clear();
  EXPECT_TRUE(params.empty());
}

TEST(PathParamsTest, ValueToStr) {
  EXPECT_EQ(PathParamValueToStr(std::string("a/b")), "a/b");
  EXPECT_EQ(PathParamValueToStr(int64_t{-17}), "-17");
  EXPECT_EQ(PathParamValueToStr(2.5), "2.5");
  EXPECT_EQ(PathParamValueToStr(*Uuid::Parse("123E4567-E89B-12D3-A456-426614174000")),
            "123e4567-e89b-12d3-a456-426614174000");
}

}  // namespace waypoint
