/**
 * @file arena.hpp
 * @brief Ember JSON - bump allocator for decoded documents
 *
 * License: MIT
 */

#ifndef EMBER_JSON_ARENA_HPP
#define EMBER_JSON_ARENA_HPP

#include "ember_json/base.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory_resource>
#include <new>
#include <vector>

namespace ember {
namespace json {

/**
 * @brief Single-block arena allocator for one decode operation
 *
 * - Single malloc: strings, arrays and objects of a document share one block
 * - Bump allocation: O(1), deallocate is a no-op
 * - Overflow: requests past the block fall back to malloc and are released
 *   together on reset() or destruction
 *
 * Not thread-safe: one Arena serves one Decoder at a time.
 */
class Arena : public std::pmr::memory_resource {
  char *buffer_;
  size_t capacity_;
  size_t offset_;
  std::vector<void *> overflows_;

public:
  explicit Arena(size_t initial_capacity = 65536)
      : buffer_(nullptr), capacity_(initial_capacity), offset_(0) {
    buffer_ = static_cast<char *>(std::malloc(capacity_));
    if (EMBER_UNLIKELY(!buffer_)) {
      throw std::bad_alloc();
    }
  }

  ~Arena() override {
    std::free(buffer_);
    for (void *p : overflows_)
      std::free(p);
  }

  Arena(const Arena &) = delete;
  Arena &operator=(const Arena &) = delete;
  Arena(Arena &&) = delete;
  Arena &operator=(Arena &&) = delete;

  // Invalidates every value allocated from this arena.
  void reset() {
    offset_ = 0;
    for (void *p : overflows_)
      std::free(p);
    overflows_.clear();
  }

  size_t capacity() const { return capacity_; }
  size_t used() const { return offset_; }
  size_t available() const { return capacity_ - offset_; }
  size_t overflow_count() const { return overflows_.size(); }

protected:
  void *do_allocate(size_t bytes, size_t alignment) override {
    const uintptr_t base = reinterpret_cast<uintptr_t>(buffer_);
    const uintptr_t cur = base + offset_;
    const size_t aligned =
        static_cast<size_t>(((cur + alignment - 1) & ~(alignment - 1)) - base);
    if (EMBER_LIKELY(aligned + bytes <= capacity_)) {
      offset_ = aligned + bytes;
      return buffer_ + aligned;
    }
    return allocate_overflow(bytes, alignment);
  }

  void do_deallocate(void *, size_t, size_t) override {}

  bool
  do_is_equal(const std::pmr::memory_resource &other) const noexcept override {
    return this == &other;
  }

private:
  void *allocate_overflow(size_t bytes, size_t alignment) {
    // aligned_alloc wants a size that is a multiple of the alignment
    if (alignment < alignof(std::max_align_t))
      alignment = alignof(std::max_align_t);
    void *p = std::aligned_alloc(alignment,
                                 (bytes + alignment - 1) & ~(alignment - 1));
    if (!p)
      throw std::bad_alloc();
    overflows_.push_back(p);
    return p;
  }
};

} // namespace json
} // namespace ember

#endif // EMBER_JSON_ARENA_HPP
