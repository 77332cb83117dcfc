#include <ember_json/ember_json.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace ember::json;

TEST(KeywordChain, BuilderIsPure) {
  constexpr KeywordChain a =
      make_keyword_chain("NumberLong", "ong", ScanState::Constructor);
  constexpr KeywordChain b =
      make_keyword_chain("NumberLong", "ong", ScanState::Constructor);
  static_assert(a == b);
  EXPECT_EQ(a, kNumberLongChain);
  EXPECT_NE(&a, &b);
}

TEST(KeywordChain, SharedChains) {
  EXPECT_EQ(kNumberChain.expected, "ber");
  EXPECT_EQ(kNumberChain.next, ScanState::AfterNumber);
  EXPECT_EQ(kNumberIntChain.expected, "nt");
  EXPECT_EQ(kNumberDecimalChain.expected, "ecimal");
  EXPECT_EQ(kNumberDecimalChain.next, ScanState::Constructor);
  EXPECT_EQ(kTrueChain.next, ScanState::EndValue);
}

TEST(KeywordChain, MismatchNamesKeywordAndExpectedByte) {
  Scanner s;
  s.step('t');
  s.step('r');
  EXPECT_EQ(s.step('x'), ScanAction::Error);
  EXPECT_EQ(s.error_message(),
            "invalid character 'x' in literal true (expecting 'u')");
}

TEST(KeywordChain, LastByteSwitchesState) {
  Scanner s;
  for (char c : std::string("NumberInt"))
    EXPECT_EQ(s.step(c) == ScanAction::Error, false);
  EXPECT_EQ(s.state(), ScanState::Constructor);
}

TEST(KeywordChain, PlainKeywords) {
  Value v;
  ASSERT_TRUE(decode("[true, false, null]", v));
  EXPECT_EQ(v[0], Value(true));
  EXPECT_EQ(v[1], Value(false));
  EXPECT_TRUE(v[2].is_null());
}

// Many scanners walk the same chain objects at once.
TEST(KeywordChain, ConcurrentDecodes) {
  const std::string json = R"([NumberInt(12), NumberLong("-7"),
    NumberDecimal("1.50"), true, false, null, {"n": NumberInt("3")}])";

  constexpr int kThreads = 8;
  constexpr int kIterations = 500;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIterations; ++i) {
        Value v;
        if (!decode(json, v)) {
          ++failures;
          continue;
        }
        if (v[0].as_number_int() != 12 || v[1].as_number_long() != -7 ||
            v[2].as_decimal128().to_string() != "1.50" ||
            v[6]["n"].as_number_int() != 3)
          ++failures;
        // Interleave malformed input on the same chains.
        Value bad;
        if (decode("NumberLonx(1)", bad))
          ++failures;
      }
    });
  }
  for (auto &th : threads)
    th.join();

  EXPECT_EQ(failures.load(), 0);
}
