/**
 * @file ember_json.hpp
 * @brief Ember JSON - extended JSON decoding, single include
 *
 * Decodes standard JSON plus the constructor literals used by document
 * databases for typed numbers:
 *
 *   { "count": NumberInt(5), "big": NumberLong("9007199254740993"),
 *     "price": NumberDecimal("1.50") }
 *
 * Requirements: C++20, {fmt}, libmpdec.
 *
 * License: MIT
 */

#ifndef EMBER_JSON_HPP
#define EMBER_JSON_HPP

#include "ember_json/arena.hpp"
#include "ember_json/base.hpp"
#include "ember_json/coercion.hpp"
#include "ember_json/decimal128.hpp"
#include "ember_json/decoder.hpp"
#include "ember_json/error.hpp"
#include "ember_json/logging.hpp"
#include "ember_json/number.hpp"
#include "ember_json/scanner.hpp"
#include "ember_json/serializer.hpp"
#include "ember_json/slot.hpp"
#include "ember_json/value.hpp"

#include <exception>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ember {
namespace json {

// ============================================================================
// Global API
// ============================================================================

/// Decodes into `out`. The result carries the position of any failure.
inline ParseResult decode(std::string_view json, Value &out,
                          DecodeOptions options = {}, Allocator alloc = {}) {
  return Decoder(json, options, alloc).decode(out);
}

inline ParseResult decode(std::string_view json, Slot &slot,
                          DecodeOptions options = {}, Allocator alloc = {}) {
  return Decoder(json, options, alloc).decode(slot);
}

/// Checks the syntax of a document without building it.
inline ParseResult validate(std::string_view json,
                            size_t max_depth = kDefaultMaxDepth) {
  DecodeOptions options;
  options.max_depth = max_depth;
  return Decoder(json, options).check_valid();
}

inline Value parse(std::string_view json, Allocator alloc = {},
                   DecodeOptions options = {}) {
  Value v;
  ParseResult r = decode(json, v, options, alloc);
  if (!r)
    throw ParseError(r);
  return v;
}

inline Value parse(const std::string &json, Allocator alloc = {},
                   DecodeOptions options = {}) {
  return parse(std::string_view(json), alloc, options);
}

inline Value parse(const char *json, Allocator alloc = {},
                   DecodeOptions options = {}) {
  return parse(std::string_view(json), alloc, options);
}

inline std::optional<Value> try_parse(std::string_view json,
                                      DecodeOptions options = {}) noexcept {
  try {
    Value v;
    if (!decode(json, v, options))
      return std::nullopt;
    return v;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

inline Value load_file(const std::string &filename,
                       DecodeOptions options = {}) {
  std::ifstream file(filename);
  if (!file)
    throw std::runtime_error("Cannot open: " + filename);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str(), {}, options);
}

} // namespace json
} // namespace ember

#endif // EMBER_JSON_HPP
