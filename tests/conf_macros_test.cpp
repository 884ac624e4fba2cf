#include "hostfleet/config/conf_macros.hpp"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace hostfleet;

TEST(ConfMacrosTest, ParsesShellWords) {
  auto macros =
      parse_macro_string("hSet:maxPlayers=16 'set:welcome=hello world' x=");
  ASSERT_TRUE(macros.has_value());
  EXPECT_EQ(macros->size(), 3u);
  EXPECT_EQ(macros->at("hSet:maxPlayers"), "16");
  EXPECT_EQ(macros->at("set:welcome"), "hello world");
  EXPECT_EQ(macros->at("x"), "");
}

TEST(ConfMacrosTest, BlankInputIsEmpty) {
  auto macros = parse_macro_string("   ");
  ASSERT_TRUE(macros.has_value());
  EXPECT_TRUE(macros->empty());
}

TEST(ConfMacrosTest, LaterDefinitionWins) {
  auto macros = parse_macro_string("a=1  a=2");
  ASSERT_TRUE(macros.has_value());
  EXPECT_EQ(macros->at("a"), "2");
}

TEST(ConfMacrosTest, TokenWithoutValueIsError) {
  EXPECT_FALSE(parse_macro_string("a=1 oops").has_value());
  EXPECT_FALSE(parse_macro_string("=value").has_value());
}

TEST(ConfMacrosTest, CommandLineArguments) {
  const std::vector<std::string> args{"ManagerName=Fleet", "InstNb=3",
                                      "set:motd=a b=c"};
  auto macros = parse_macro_args(args);
  ASSERT_TRUE(macros.has_value());
  EXPECT_EQ(macros->at("ManagerName"), "Fleet");
  EXPECT_EQ(macros->at("set:motd"), "a b=c");

  const std::vector<std::string> bad{"InstNb"};
  auto r = parse_macro_args(bad);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfMacrosTest, ExpandsKnownPlaceholdersOnly) {
  const MacroMap values{{"InstNb", "4"}, {"PresetName", "ffa"}};
  EXPECT_EQ(expand_placeholders("%PresetName%-%InstNb%", values), "ffa-4");
  EXPECT_EQ(expand_placeholders("%Unknown%x", values), "%Unknown%x");
  EXPECT_EQ(expand_placeholders("100% %InstNb%", values), "100% 4");
  EXPECT_EQ(expand_placeholders("trailing %", values), "trailing %");
}

TEST(ConfMacrosTest, ContainsPlaceholder) {
  EXPECT_TRUE(contains_placeholder("Host%InstNb%", "InstNb"));
  EXPECT_FALSE(contains_placeholder("Host%InstNb2%", "InstNb"));
}
