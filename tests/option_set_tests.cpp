#include <gtest/gtest.h>

#include "../src/models/option_set.hpp"

using models::OptionSet;
using models::OptionValue;

TEST(OptionSetTest, Parse_FlagsAndValues) {
  auto options = OptionSet::Parse("R, l=$R_{1}$, line   width=1pt,,-o");

  ASSERT_EQ(options.Size(), 4u);
  EXPECT_EQ(options.Entries()[0].first, "R");
  EXPECT_EQ(options.Find("R")->kind, OptionValue::Kind::kFlag);
  EXPECT_EQ(options.GetString("l"), "$R_{1}$");
  EXPECT_EQ(options.GetString("line width"), "1pt");
  EXPECT_TRUE(options.Has("-o"));
  EXPECT_FALSE(options.GetString("R").has_value());
}

TEST(OptionSetTest, Parse_EqualsInsideMathIsNotAssignment) {
  auto options = OptionSet::Parse("l={$a=b$}");

  ASSERT_EQ(options.Size(), 1u);
  EXPECT_EQ(options.GetString("l"), "$a=b$");
}

TEST(OptionSetTest, Parse_BracedCommaValue_IsList) {
  auto options = OptionSet::Parse("draw={rgb,255:red,1;green,2;blue,3}");

  const OptionValue *value = options.Find("draw");
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->kind, OptionValue::Kind::kList);
  EXPECT_EQ(value->items.size(), 3u);
  EXPECT_EQ(options.GetString("draw"), "rgb,255:red,1;green,2;blue,3");
}

TEST(OptionSetTest, Set_LastWriteWinsAndKeepsPosition) {
  auto options = OptionSet::Parse("color=red, thick, color=blue");

  ASSERT_EQ(options.Size(), 2u);
  EXPECT_EQ(options.Entries()[0].first, "color");
  EXPECT_EQ(options.GetString("color"), "blue");
}

TEST(OptionSetTest, GetNumber) {
  auto options = OptionSet::Parse("rotate=-45, xscale=2cm, name=x");

  EXPECT_EQ(options.GetNumber("rotate"), -45.0);
  EXPECT_FALSE(options.GetNumber("xscale").has_value());
  EXPECT_FALSE(options.GetNumber("name").has_value());
  EXPECT_FALSE(options.GetNumber("missing").has_value());
}

TEST(OptionSetTest, Merge_OtherWins) {
  auto path = OptionSet::Parse("thick, color=red");
  path.Merge(OptionSet::Parse("R, color=blue"));

  EXPECT_EQ(path.Size(), 3u);
  EXPECT_EQ(path.GetString("color"), "blue");
  EXPECT_EQ(path.Flags(), (std::vector<std::string>{"thick", "R"}));
}

TEST(OptionSetTest, Equality_IgnoresOrder) {
  EXPECT_EQ(OptionSet::Parse("a, b=1"), OptionSet::Parse("b=1, a"));
  EXPECT_NE(OptionSet::Parse("a, b=1"), OptionSet::Parse("a, b=2"));
}
