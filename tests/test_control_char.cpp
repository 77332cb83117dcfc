#include <ember_json/ember_json.hpp>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

using namespace ember::json;

// Unescaped control characters (< 0x20) are rejected inside strings, in keys
// and in constructor arguments alike.

static bool decode_ok(std::string_view json) {
  Value v;
  return static_cast<bool>(decode(json, v));
}

TEST(ControlChar, ValidStringsAccepted) {
  EXPECT_TRUE(decode_ok(R"({"a":"valid"})"));
  EXPECT_TRUE(decode_ok(R"({"a":"hello world"})"));
}

TEST(ControlChar, LiteralNewlineRejected) {
  std::string json = "{\"key\":\"line1\nline2\"}";
  Value v;
  ParseResult res = decode(json, v);
  EXPECT_FALSE(res);
  EXPECT_EQ(res.message, "invalid character '\\x0a' in string literal");
  EXPECT_EQ(res.offset, 13u);
}

TEST(ControlChar, LiteralTabRejected) {
  EXPECT_FALSE(decode_ok("{\"key\":\"tab\tchar\"}"));
  EXPECT_FALSE(decode_ok("{\"k\tey\":1}"));
  EXPECT_FALSE(decode_ok("NumberLong(\"1\t\")"));
}

TEST(ControlChar, EscapedFormsDecode) {
  Value v = parse(R"(["a\nb", "tab\there", "\u0001"])");
  EXPECT_EQ(v[0].as_string_view(), "a\nb");
  EXPECT_EQ(v[1].as_string_view(), "tab\there");
  EXPECT_EQ(v[2].as_string_view(), std::string_view("\x01", 1));
  EXPECT_EQ(dump(v), R"(["a\nb","tab\there","\u0001"])");
}

TEST(ControlChar, DelIsNotControl) {
  EXPECT_TRUE(decode_ok("\"\x7f\""));
}
