#include <ember_json/ember_json.hpp>
#include <gtest/gtest.h>
#include <string>

using namespace ember::json;

// Objects keep every member in input order; lookups see the last one.

TEST(DuplicateKeys, AlwaysAccepted) {
  EXPECT_NO_THROW(parse(R"({"key": 1, "key": 2})"));
  EXPECT_NO_THROW(parse(R"({"a": 1, "b": 2, "a": 3, "a": 99})"));
}

TEST(DuplicateKeys, LastOccurrenceWins) {
  Value v = parse(R"({"a": 1, "b": 2, "a": NumberInt(3)})");
  EXPECT_EQ(v.size(), 3u);
  EXPECT_EQ(v["a"].as_number_int(), 3);
  EXPECT_EQ(v["b"].as_int64(), 2);
}

TEST(DuplicateKeys, RoundTrip) {
  std::string json = R"({"a":1,"a":2,"b":3})";
  EXPECT_EQ(dump(parse(json)), json);
}

TEST(DuplicateKeys, MissingKeyThrows) {
  Value v = parse(R"({"x":1})");
  EXPECT_TRUE(v.as_object().contains("x"));
  EXPECT_FALSE(v.as_object().contains("y"));
  EXPECT_EQ(v.as_object().find("y"), nullptr);
  EXPECT_THROW(v["y"], TypeError);
}
