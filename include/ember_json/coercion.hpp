/**
 * @file coercion.hpp
 * @brief Ember JSON - constructor argument coercion
 *
 * Turns one decoded constructor argument into a typed literal value. An
 * argument is accepted either as a bare number (kept as Number text by the
 * decoder) or as a quoted string; the text is used exactly as written, with
 * no trimming.
 *
 * License: MIT
 */

#ifndef EMBER_JSON_COERCION_HPP
#define EMBER_JSON_COERCION_HPP

#include "ember_json/decimal128.hpp"
#include "ember_json/error.hpp"
#include "ember_json/number.hpp"
#include "ember_json/serializer.hpp"
#include "ember_json/value.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ember {
namespace json {

/// Declared type of a constructor argument.
enum class ArgKind : uint8_t {
  Any,    // Dynamic value, no coercion
  Number, // Number text, from a bare number or a string
  String,
  Int32,
  Int64,
  Decimal128
};

inline const char *arg_kind_name(ArgKind kind) {
  switch (kind) {
  case ArgKind::Any:
    return "value";
  case ArgKind::Number:
    return "number";
  case ArgKind::String:
    return "string";
  case ArgKind::Int32:
    return "int32";
  case ArgKind::Int64:
    return "int64";
  case ArgKind::Decimal128:
    return "decimal128";
  }
  return "value";
}

namespace detail {

inline std::string ordinal(size_t position) {
  static constexpr const char *kWords[] = {"first", "second", "third",
                                           "fourth", "fifth"};
  if (position < 5)
    return kWords[position];
  return "#" + std::to_string(position + 1);
}

inline std::string expected_argument(std::string_view want, size_t position,
                                     std::string_view ctor, const Value &got) {
  std::string msg = "expected ";
  msg += want;
  msg += " for " + ordinal(position) + " argument of ";
  msg += ctor;
  msg += " constructor, got ";
  msg += got.type_name();
  msg += " (value was " + dump(got) + ")";
  return msg;
}

inline bool is_json_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Text of a Number or string argument; anything else is an ArgumentType
// failure.
inline ParseResult numeric_text(const Value &arg, std::string_view want,
                                std::string_view ctor, size_t position,
                                std::string_view &text) {
  if (arg.is_number()) {
    text = arg.as_number().str();
    return ParseResult::ok();
  }
  if (arg.is_string()) {
    text = arg.as_string_view();
    return ParseResult::ok();
  }
  return ParseResult::fail(Error::ArgumentType,
                           expected_argument(want, position, ctor, arg));
}

} // namespace detail

inline ParseResult to_int32(const Value &arg, std::string_view ctor,
                            size_t position, int32_t &out) {
  std::string_view text;
  EMBER_TRY(detail::numeric_text(arg, "int32", ctor, position, text));
  auto v = detail::parse_base10<int32_t>(text);
  if (!v)
    return ParseResult::fail(
        Error::Range, detail::expected_argument("int32", position, ctor, arg));
  out = *v;
  return ParseResult::ok();
}

inline ParseResult to_int64(const Value &arg, std::string_view ctor,
                            size_t position, int64_t &out) {
  std::string_view text;
  EMBER_TRY(detail::numeric_text(arg, "int64", ctor, position, text));
  auto v = detail::parse_base10<int64_t>(text);
  if (!v)
    return ParseResult::fail(
        Error::Range, detail::expected_argument("int64", position, ctor, arg));
  out = *v;
  return ParseResult::ok();
}

inline ParseResult to_decimal128(const Value &arg, std::string_view ctor,
                                 size_t position, Decimal128 &out) {
  std::string_view text;
  EMBER_TRY(detail::numeric_text(arg, "decimal128", ctor, position, text));
  if (text.empty() || detail::is_json_space(text.front()) ||
      detail::is_json_space(text.back()))
    return ParseResult::fail(Error::DecimalParse,
                             "parse decimal error: '" + std::string(text) +
                                 "' is not a valid decimal128 string");
  ParseResult r = Decimal128::parse(text, out);
  if (!r)
    r.message = "parse decimal error: " + r.message;
  return r;
}

/**
 * @brief Converts a decoded argument to the declared kind.
 *
 * @param arg      argument decoded with numbers preserved as text
 * @param kind     declared type of the argument
 * @param ctor     constructor name, for diagnostics
 * @param position zero-based argument position, for diagnostics
 * @param out      receives the typed value on success
 */
inline ParseResult coerce_argument(const Value &arg, ArgKind kind,
                                   std::string_view ctor, size_t position,
                                   Value &out) {
  switch (kind) {
  case ArgKind::Any:
    out = arg;
    return ParseResult::ok();
  case ArgKind::Number: {
    std::string_view text;
    EMBER_TRY(detail::numeric_text(arg, "number", ctor, position, text));
    out = Value(Number(text));
    return ParseResult::ok();
  }
  case ArgKind::String:
    if (!arg.is_string())
      return ParseResult::fail(
          Error::ArgumentType,
          detail::expected_argument("string", position, ctor, arg));
    out = arg;
    return ParseResult::ok();
  case ArgKind::Int32: {
    int32_t v = 0;
    EMBER_TRY(to_int32(arg, ctor, position, v));
    out = Value(NumberInt{v});
    return ParseResult::ok();
  }
  case ArgKind::Int64: {
    int64_t v = 0;
    EMBER_TRY(to_int64(arg, ctor, position, v));
    out = Value(NumberLong{v});
    return ParseResult::ok();
  }
  case ArgKind::Decimal128: {
    Decimal128 v;
    EMBER_TRY(to_decimal128(arg, ctor, position, v));
    out = Value(v);
    return ParseResult::ok();
  }
  }
  return ParseResult::fail(Error::ArgumentType, "unknown argument kind");
}

} // namespace json
} // namespace ember

#endif // EMBER_JSON_COERCION_HPP
