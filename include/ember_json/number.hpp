/**
 * @file number.hpp
 * @brief Ember JSON - textual number wrapper
 *
 * License: MIT
 */

#ifndef EMBER_JSON_NUMBER_HPP
#define EMBER_JSON_NUMBER_HPP

#include "ember_json/decimal128.hpp"
#include "ember_json/error.hpp"

#include <charconv> // from_chars for the integer and float conversions
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace ember {
namespace json {

namespace detail {

// Base-10 signed integer, optional leading '+', no whitespace.
template <typename T> std::optional<T> parse_base10(std::string_view s) {
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s.front() == '-')
      return std::nullopt;
  }
  if (s.empty())
    return std::nullopt;
  T value{};
  const char *end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, value, 10);
  if (ec != std::errc() || ptr != end)
    return std::nullopt;
  return value;
}

} // namespace detail

/**
 * @brief A number kept as the text it was written with
 *
 * Produced for bare numeric literals when the decoder preserves numbers
 * (constructor arguments, DecodeOptions::use_number) and for quoted
 * constructor arguments. Every conversion re-reads the text.
 */
class Number {
  std::string text_;

public:
  Number() = default;
  explicit Number(std::string text) : text_(std::move(text)) {}
  explicit Number(std::string_view text) : text_(text) {}
  explicit Number(const char *text) : text_(text) {}

  const std::string &str() const noexcept { return text_; }
  bool empty() const noexcept { return text_.empty(); }

  std::optional<int32_t> int32() const {
    return detail::parse_base10<int32_t>(text_);
  }

  std::optional<int64_t> int64() const {
    return detail::parse_base10<int64_t>(text_);
  }

  std::optional<double> float64() const {
    double value = 0;
    const char *end = text_.data() + text_.size();
    auto [ptr, ec] = std::from_chars(text_.data(), end, value);
    if (text_.empty() || ec != std::errc() || ptr != end)
      return std::nullopt;
    return value;
  }

  ParseResult decimal128(Decimal128 &out) const {
    return Decimal128::parse(text_, out);
  }

  friend bool operator==(const Number &, const Number &) = default;
};

} // namespace json
} // namespace ember

#endif // EMBER_JSON_NUMBER_HPP
