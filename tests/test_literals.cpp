#include <ember_json/ember_json.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace ember::json;

class LiteralTest : public ::testing::Test {
protected:
  Value out;

  ParseResult run(const std::string &json) {
    out = Value();
    return decode(json, out);
  }
};

// Bare and quoted arguments decode to the same int32.
TEST_F(LiteralTest, NumberIntBareAndQuotedAgree) {
  std::vector<int32_t> samples = {0,
                                  1,
                                  -1,
                                  42,
                                  -2147483647,
                                  std::numeric_limits<int32_t>::min(),
                                  std::numeric_limits<int32_t>::max()};
  for (int32_t n : samples) {
    const std::string text = std::to_string(n);
    ASSERT_TRUE(run("NumberInt(" + text + ")")) << text;
    Value bare = out;
    ASSERT_TRUE(run("NumberInt(\"" + text + "\")")) << text;
    EXPECT_EQ(bare, out);
    ASSERT_TRUE(out.is_number_int());
    EXPECT_EQ(out.as_number_int(), n);
  }
}

TEST_F(LiteralTest, NumberLongBareAndQuotedAgree) {
  std::vector<int64_t> samples = {0, -5, 2147483648LL,
                                  std::numeric_limits<int64_t>::min(),
                                  std::numeric_limits<int64_t>::max()};
  for (int64_t n : samples) {
    const std::string text = std::to_string(n);
    ASSERT_TRUE(run("NumberLong(" + text + ")")) << text;
    Value bare = out;
    ASSERT_TRUE(run("NumberLong(\"" + text + "\")")) << text;
    EXPECT_EQ(bare, out);
    EXPECT_EQ(out.as_number_long(), n);
  }
}

TEST_F(LiteralTest, WiderThanInt32) {
  ParseResult res = run("NumberInt(2147483648)");
  EXPECT_FALSE(res);
  EXPECT_EQ(res.error, Error::Range);
  EXPECT_EQ(res.message, "expected int32 for first argument of NumberInt "
                         "constructor, got Number (value was 2147483648)");

  ASSERT_TRUE(run("NumberLong(2147483648)"));
  EXPECT_EQ(out.as_number_long(), 2147483648LL);

  EXPECT_EQ(run("NumberInt(-2147483649)").error, Error::Range);
}

TEST_F(LiteralTest, WiderThanInt64) {
  ParseResult res = run("NumberLong(\"9223372036854775808\")");
  EXPECT_FALSE(res);
  EXPECT_EQ(res.error, Error::Range);
  EXPECT_EQ(res.message,
            "expected int64 for first argument of NumberLong constructor, got "
            "string (value was \"9223372036854775808\")");
  EXPECT_EQ(run("NumberLong(9223372036854775808)").error, Error::Range);
}

TEST_F(LiteralTest, FractionalIntegerArgument) {
  ParseResult res = run("NumberInt(5.5)");
  EXPECT_EQ(res.error, Error::Range);
  EXPECT_EQ(run("NumberLong(1e3)").error, Error::Range);
}

TEST_F(LiteralTest, DecimalKeepsTrailingZeros) {
  ASSERT_TRUE(run("NumberDecimal(\"1.50\")"));
  ASSERT_TRUE(out.is_decimal128());
  EXPECT_EQ(out.as_decimal128().to_string(), "1.50");
  EXPECT_EQ(dump(out), "NumberDecimal(\"1.50\")");
}

TEST_F(LiteralTest, DecimalFromBareNumber) {
  // The argument text reaches the decimal parser unwidened.
  ASSERT_TRUE(run("NumberDecimal(0.1000000000000000000000000000000001)"));
  EXPECT_EQ(out.as_decimal128().to_string(),
            "0.1000000000000000000000000000000001");
}

TEST_F(LiteralTest, DecimalParseFailure) {
  ParseResult res = run("NumberDecimal(\"abc\")");
  EXPECT_FALSE(res);
  EXPECT_EQ(res.error, Error::DecimalParse);
  EXPECT_EQ(res.message,
            "parse decimal error: 'abc' is not a valid decimal128 string");
}

TEST_F(LiteralTest, ArityMismatch) {
  ParseResult res = run("NumberInt(1,2)");
  EXPECT_EQ(res.error, Error::ArityMismatch);
  EXPECT_EQ(res.message,
            "expected 1 argument(s) in NumberInt constructor, but 2 received");

  res = run("NumberInt()");
  EXPECT_EQ(res.error, Error::ArityMismatch);
  EXPECT_EQ(res.message,
            "expected 1 argument(s) in NumberInt constructor, but 0 received");

  res = run("NumberDecimal( )");
  EXPECT_EQ(res.error, Error::ArityMismatch);
  EXPECT_EQ(res.message, "expected 1 argument(s) in NumberDecimal "
                         "constructor, but 0 received");
}

// Arity is checked before any argument is coerced.
TEST_F(LiteralTest, ArityBeforeCoercion) {
  ParseResult res = run("NumberLong(true, [1])");
  EXPECT_EQ(res.error, Error::ArityMismatch);
}

TEST_F(LiteralTest, UnquotedWordIsSyntaxError) {
  ParseResult res = run("NumberInt(abc)");
  EXPECT_FALSE(res);
  EXPECT_EQ(res.error, Error::Syntax);
  EXPECT_EQ(res.message, "invalid character 'a' looking for beginning of value");
}

TEST_F(LiteralTest, ArgumentOfWrongKind) {
  ParseResult res = run("NumberInt(true)");
  EXPECT_EQ(res.error, Error::ArgumentType);
  EXPECT_EQ(res.message, "expected int32 for first argument of NumberInt "
                         "constructor, got bool (value was true)");

  res = run("NumberLong([1, 2])");
  EXPECT_EQ(res.error, Error::ArgumentType);
  EXPECT_EQ(res.message, "expected int64 for first argument of NumberLong "
                         "constructor, got array (value was [1,2])");

  res = run("NumberDecimal(null)");
  EXPECT_EQ(res.error, Error::ArgumentType);
}

TEST_F(LiteralTest, NestedLiteralArgumentIsRejected) {
  ParseResult res = run("NumberLong(NumberInt(1))");
  EXPECT_EQ(res.error, Error::ArgumentType);
  EXPECT_EQ(res.message, "expected int64 for first argument of NumberLong "
                         "constructor, got NumberInt (value was NumberInt(1))");
}

TEST_F(LiteralTest, WhitespaceInsideQuotedArgumentRejected) {
  EXPECT_EQ(run("NumberInt(\" 5\")").error, Error::Range);
  EXPECT_EQ(run("NumberLong(\"5 \")").error, Error::Range);
  EXPECT_EQ(run("NumberDecimal(\" 1.5\")").error, Error::DecimalParse);
}

TEST_F(LiteralTest, WhitespaceAroundTokens) {
  ASSERT_TRUE(run("NumberInt ( 5 )"));
  EXPECT_EQ(out.as_number_int(), 5);
  ASSERT_TRUE(run("NumberLong\n(\t\"6\"\r\n)"));
  EXPECT_EQ(out.as_number_long(), 6);
}

TEST_F(LiteralTest, SignHandling) {
  ASSERT_TRUE(run("NumberInt(\"+5\")"));
  EXPECT_EQ(out.as_number_int(), 5);
  ASSERT_TRUE(run("NumberInt(-0)"));
  EXPECT_EQ(out.as_number_int(), 0);
  // A bare '+' is not JSON.
  EXPECT_EQ(run("NumberInt(+5)").error, Error::Syntax);
  EXPECT_EQ(run("NumberInt(\"+-5\")").error, Error::Range);
}

TEST_F(LiteralTest, NumberPrefixFailures) {
  ParseResult res = run("Numberx");
  EXPECT_EQ(res.error, Error::Syntax);
  EXPECT_NE(res.message.find("'x'"), std::string::npos);
  EXPECT_NE(res.message.find("'I', 'L' or 'D'"), std::string::npos);

  EXPECT_EQ(run("Numx").error, Error::Syntax);
  EXPECT_EQ(run("Number(5)").error, Error::Syntax);
  EXPECT_EQ(run("NumberIntx(5)").error, Error::Syntax);
  EXPECT_EQ(run("NumberInt 5").error, Error::Syntax);
}

TEST_F(LiteralTest, LiteralsInsideDocuments) {
  ASSERT_TRUE(run(R"({"a": NumberInt(5), "b": [NumberLong("7"),
                     NumberDecimal("-0.001")], "c": 1})"));
  EXPECT_EQ(out["a"].as_number_int(), 5);
  EXPECT_EQ(out["b"][0].as_number_long(), 7);
  EXPECT_EQ(out["b"][1].as_decimal128().to_string(), "-0.001");
  EXPECT_EQ(out["c"].as_int64(), 1);
}

TEST_F(LiteralTest, UseNumberDoesNotChangeLiterals) {
  DecodeOptions opts;
  opts.use_number = true;
  ASSERT_TRUE(decode("[NumberInt(5), 5]", out, opts));
  EXPECT_TRUE(out[0].is_number_int());
  EXPECT_TRUE(out[1].is_number());
}

TEST_F(LiteralTest, ArgumentNumbersDoNotLeakPreservation) {
  // Only the constructor arguments keep their text.
  ASSERT_TRUE(run("[NumberInt(1), 2, {\"x\": 3.5}]"));
  EXPECT_TRUE(out[1].is_integer());
  EXPECT_TRUE(out[2]["x"].is_double());
}

TEST_F(LiteralTest, FailurePointsAtLiteral) {
  ParseResult res = run("{\"a\": NumberInt(1, 2)}");
  EXPECT_EQ(res.error, Error::ArityMismatch);
  EXPECT_EQ(res.offset, 6u);
  EXPECT_EQ(res.line, 1u);
  EXPECT_EQ(res.column, 7u);

  res = run("[\n  NumberLong(\"x\")\n]");
  EXPECT_EQ(res.error, Error::Range);
  EXPECT_EQ(res.line, 2u);
  EXPECT_EQ(res.column, 3u);
}
