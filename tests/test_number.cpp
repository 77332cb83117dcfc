#include <ember_json/ember_json.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace ember::json;

TEST(Number, KeepsText) {
  Number n("1.50");
  EXPECT_EQ(n.str(), "1.50");
  EXPECT_FALSE(n.empty());
  EXPECT_TRUE(Number().empty());
}

TEST(Number, IntegerConversions) {
  EXPECT_EQ(Number("42").int32(), 42);
  EXPECT_EQ(Number("-2147483648").int32(), INT32_MIN);
  EXPECT_FALSE(Number("2147483648").int32());
  EXPECT_EQ(Number("2147483648").int64(), 2147483648LL);
  EXPECT_EQ(Number("+7").int64(), 7);
  EXPECT_FALSE(Number("9223372036854775808").int64());
  EXPECT_FALSE(Number("1.0").int64());
  EXPECT_FALSE(Number("1e2").int32());
  EXPECT_FALSE(Number("").int32());
  EXPECT_FALSE(Number("+").int32());
}

TEST(Number, FloatConversion) {
  EXPECT_DOUBLE_EQ(*Number("2.5").float64(), 2.5);
  EXPECT_DOUBLE_EQ(*Number("-1e3").float64(), -1000.0);
  EXPECT_FALSE(Number("abc").float64());
  EXPECT_FALSE(Number("1.5x").float64());
}

TEST(Number, DecimalConversion) {
  Decimal128 d;
  ASSERT_TRUE(Number("1.50").decimal128(d));
  EXPECT_EQ(d.to_string(), "1.50");
}

// Conversions re-read the text every time.
TEST(Number, ConversionsAreRepeatable) {
  Number n("123");
  EXPECT_EQ(n.int32(), 123);
  EXPECT_EQ(n.int32(), 123);
  EXPECT_EQ(n.str(), "123");
}

TEST(Coercion, Int32FromNumberAndString) {
  int32_t v = 0;
  ASSERT_TRUE(to_int32(Value(Number("17")), "NumberInt", 0, v));
  EXPECT_EQ(v, 17);
  ASSERT_TRUE(to_int32(Value("-17"), "NumberInt", 0, v));
  EXPECT_EQ(v, -17);
}

TEST(Coercion, Int32Range) {
  int32_t v = 5;
  ParseResult res = to_int32(Value(Number("4294967296")), "NumberInt", 0, v);
  EXPECT_EQ(res.error, Error::Range);
  EXPECT_EQ(v, 5);
}

TEST(Coercion, RejectsOtherKinds) {
  int64_t v = 0;
  ParseResult res = to_int64(Value(3.5), "NumberLong", 0, v);
  EXPECT_EQ(res.error, Error::ArgumentType);
  EXPECT_EQ(res.message, "expected int64 for first argument of NumberLong "
                         "constructor, got double (value was 3.5)");

  res = to_int64(Value::object(), "NumberLong", 1, v);
  EXPECT_EQ(res.message, "expected int64 for second argument of NumberLong "
                         "constructor, got object (value was {})");
}

TEST(Coercion, DecimalPrefixesParserMessage) {
  Decimal128 d;
  ParseResult res = to_decimal128(Value("1E7000"), "NumberDecimal", 0, d);
  EXPECT_EQ(res.error, Error::DecimalParse);
  EXPECT_EQ(res.message, "parse decimal error: value '1E7000' is out of "
                         "range for decimal128");

  ASSERT_TRUE(to_decimal128(Value(Number("-2.0")), "NumberDecimal", 0, d));
  EXPECT_EQ(d.to_string(), "-2.0");
}

TEST(Coercion, CoerceArgumentByKind) {
  Value out;
  ASSERT_TRUE(coerce_argument(Value(Number("9")), ArgKind::Int32, "X", 0, out));
  EXPECT_EQ(out, Value(NumberInt{9}));

  ASSERT_TRUE(coerce_argument(Value("9"), ArgKind::Int64, "X", 0, out));
  EXPECT_EQ(out, Value(NumberLong{9}));

  ASSERT_TRUE(coerce_argument(Value("9"), ArgKind::Number, "X", 0, out));
  EXPECT_EQ(out, Value(Number("9")));

  ASSERT_TRUE(coerce_argument(Value(true), ArgKind::Any, "X", 0, out));
  EXPECT_EQ(out, Value(true));

  ParseResult res = coerce_argument(Value(Number("9")), ArgKind::String, "X",
                                    2, out);
  EXPECT_EQ(res.error, Error::ArgumentType);
  EXPECT_EQ(res.message, "expected string for third argument of X "
                         "constructor, got Number (value was 9)");
}

TEST(Coercion, KindNames) {
  EXPECT_STREQ(arg_kind_name(ArgKind::Int32), "int32");
  EXPECT_STREQ(arg_kind_name(ArgKind::Decimal128), "decimal128");
}
