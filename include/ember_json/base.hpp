/**
 * @file base.hpp
 * @brief Ember JSON - common type aliases and compiler hints
 *
 * License: MIT
 */

#ifndef EMBER_JSON_BASE_HPP
#define EMBER_JSON_BASE_HPP

#include <memory_resource>
#include <string>
#include <vector>

// ============================================================================
// Data Types (C++20 PMR Aware)
// ============================================================================

namespace ember {
namespace json {

#if __cplusplus >= 202002L
using String = std::pmr::string;
template <typename T> using Vector = std::pmr::vector<T>;
using Allocator = std::pmr::polymorphic_allocator<char>;
#else
#error "Ember JSON requires a C++20 compatible compiler."
#endif

} // namespace json
} // namespace ember

// ============================================================================
// Compiler Intrinsics & Branching Hints
// ============================================================================

#ifdef __GNUC__
#define EMBER_INLINE __attribute__((always_inline)) inline
#define EMBER_LIKELY(x) __builtin_expect(!!(x), 1)
#define EMBER_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define EMBER_INLINE inline
#define EMBER_LIKELY(x) (x)
#define EMBER_UNLIKELY(x) (x)
#endif

#endif // EMBER_JSON_BASE_HPP
