/**
 * @file serializer.hpp
 * @brief Ember JSON - compact extended JSON output
 *
 * Typed literals are written back in constructor form, so decoding the
 * output yields the same value tree:
 *
 *   NumberInt(5)  NumberLong(9007199254740993)  NumberDecimal("1.50")
 *
 * License: MIT
 */

#ifndef EMBER_JSON_SERIALIZER_HPP
#define EMBER_JSON_SERIALIZER_HPP

#include "ember_json/value.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ember {
namespace json {

class StringBuffer {
  std::vector<char> buffer_;

public:
  StringBuffer() { buffer_.reserve(256); }

  void put(char c) { buffer_.push_back(c); }

  void write(const char *data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
  }

  void write(std::string_view s) { write(s.data(), s.size()); }

  void clear() { buffer_.clear(); }

  std::string str() const {
    return std::string(buffer_.data(), buffer_.size());
  }

  const char *data() const { return buffer_.data(); }
  size_t size() const { return buffer_.size(); }
};

namespace detail {

template <typename T> inline void append_integer(StringBuffer &out, T value) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  (void)ec; // 24 bytes always fit a 64-bit integer
  out.write(buf, static_cast<size_t>(ptr - buf));
}

inline void append_escaped(StringBuffer &out, std::string_view s) {
  static constexpr char kHex[] = "0123456789abcdef";
  out.put('"');
  for (char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
    case '"':
      out.write("\\\"", 2);
      break;
    case '\\':
      out.write("\\\\", 2);
      break;
    case '\n':
      out.write("\\n", 2);
      break;
    case '\r':
      out.write("\\r", 2);
      break;
    case '\t':
      out.write("\\t", 2);
      break;
    case '\b':
      out.write("\\b", 2);
      break;
    case '\f':
      out.write("\\f", 2);
      break;
    default:
      if (c < 0x20) {
        const char esc[6] = {'\\', 'u', '0', '0', kHex[c >> 4], kHex[c & 0xF]};
        out.write(esc, 6);
      } else {
        out.put(ch);
      }
    }
  }
  out.put('"');
}

} // namespace detail

class Serializer {
  StringBuffer &out_;

public:
  explicit Serializer(StringBuffer &out) : out_(out) {}

  void write(const Value &v) {
    switch (v.type()) {
    case ValueType::Null:
      out_.write("null", 4);
      break;
    case ValueType::Boolean:
      write(v.as_bool());
      break;
    case ValueType::Integer:
      detail::append_integer(out_, v.as_int64());
      break;
    case ValueType::Double:
      write(v.as_double());
      break;
    case ValueType::String:
      detail::append_escaped(out_, v.as_string_view());
      break;
    case ValueType::Number:
      out_.write(v.as_number().str());
      break;
    case ValueType::NumberInt:
      out_.write("NumberInt(");
      detail::append_integer(out_, v.as_number_int());
      out_.put(')');
      break;
    case ValueType::NumberLong:
      out_.write("NumberLong(");
      detail::append_integer(out_, v.as_number_long());
      out_.put(')');
      break;
    case ValueType::NumberDecimal:
      out_.write("NumberDecimal(\"");
      out_.write(v.as_decimal128().to_string());
      out_.write("\")");
      break;
    case ValueType::Array: {
      out_.put('[');
      bool first = true;
      for (const auto &item : v.as_array()) {
        if (!first)
          out_.put(',');
        first = false;
        write(item);
      }
      out_.put(']');
      break;
    }
    case ValueType::Object: {
      out_.put('{');
      bool first = true;
      for (const auto &m : v.as_object()) {
        if (!first)
          out_.put(',');
        first = false;
        detail::append_escaped(out_, m.key);
        out_.put(':');
        write(m.value);
      }
      out_.put('}');
      break;
    }
    }
  }

  void write(bool value) {
    out_.write(value ? "true" : "false", value ? 4 : 5);
  }

  void write(double value) {
    if (std::isnan(value)) {
      out_.write("null", 4);
      return;
    }
    if (std::isinf(value)) {
      out_.write(value < 0 ? "\"-Infinity\"" : "\"Infinity\"");
      return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    (void)ec; // shortest round-trip form fits in 32 bytes
    out_.write(buf, static_cast<size_t>(ptr - buf));
    // Keep integral doubles (3.0, -0.0) decoding back as doubles.
    if (std::string_view(buf, static_cast<size_t>(ptr - buf))
            .find_first_of(".e") == std::string_view::npos)
      out_.write(".0", 2);
  }
};

inline std::string dump(const Value &v) {
  StringBuffer buf;
  Serializer(buf).write(v);
  return buf.str();
}

inline std::ostream &operator<<(std::ostream &os, const Value &v) {
  return os << dump(v);
}

} // namespace json
} // namespace ember

#endif // EMBER_JSON_SERIALIZER_HPP
