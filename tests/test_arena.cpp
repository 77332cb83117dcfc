#include <ember_json/ember_json.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace ember::json;

TEST(Arena, DecodesIntoArena) {
  Arena arena(64 * 1024);
  Value v = parse(R"({"name": "a string long enough to need the heap",
                      "items": [NumberInt(1), NumberLong(2), "x"]})",
                  &arena);
  EXPECT_GT(arena.used(), 0u);
  EXPECT_EQ(arena.overflow_count(), 0u);
  EXPECT_EQ(v["items"][0].as_number_int(), 1);
  EXPECT_EQ(v["name"].as_string_view(),
            "a string long enough to need the heap");
}

TEST(Arena, AlignedAllocations) {
  Arena arena(1024);
  void *a = arena.allocate(3, 1);
  void *b = arena.allocate(16, 16);
  EXPECT_NE(a, nullptr);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(b) % 16, 0u);
  EXPECT_LE(arena.used(), 3u + 15u + 16u);
}

TEST(Arena, OverflowFallsBackToHeap) {
  Arena arena(128);
  void *p = arena.allocate(1024, 8);
  EXPECT_NE(p, nullptr);
  EXPECT_EQ(arena.overflow_count(), 1u);
  EXPECT_EQ(arena.used(), 0u);
  arena.reset();
  EXPECT_EQ(arena.overflow_count(), 0u);
}

TEST(Arena, ResetReusesBlock) {
  Arena arena(4096);
  {
    Value v = parse("[\"0123456789012345678901234567890123456789\"]", &arena);
    EXPECT_EQ(v.size(), 1u);
  }
  size_t first = arena.used();
  EXPECT_GT(first, 0u);
  arena.reset();
  EXPECT_EQ(arena.used(), 0u);
  EXPECT_EQ(arena.available(), arena.capacity());
}
