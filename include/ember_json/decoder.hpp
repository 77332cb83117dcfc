/**
 * @file decoder.hpp
 * @brief Ember JSON - value decoder for the extended JSON dialect
 *
 * Decoding runs in two passes over the input. The first drives a Scanner
 * over every byte and reports the first syntax error; the second assumes a
 * well-formed document and builds the result, reading one byte ahead and
 * handing it back to the scanner with undo() where a token ends.
 *
 * Constructor literals (NumberInt, NumberLong, NumberDecimal) are decoded
 * with their arguments' numbers kept as text, then coerced to the literal's
 * type. Into a Slot that only holds a fixed C++ type they are refused
 * before the arguments are looked at.
 *
 * License: MIT
 */

#ifndef EMBER_JSON_DECODER_HPP
#define EMBER_JSON_DECODER_HPP

#include "ember_json/base.hpp"
#include "ember_json/coercion.hpp"
#include "ember_json/error.hpp"
#include "ember_json/logging.hpp"
#include "ember_json/number.hpp"
#include "ember_json/scanner.hpp"
#include "ember_json/slot.hpp"
#include "ember_json/value.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ember {
namespace json {

// ============================================================================
// Options
// ============================================================================

struct DecodeOptions {
  bool use_number = false; // Keep plain numbers as Number text
  size_t max_depth = kDefaultMaxDepth;
};

/// How bare numeric literals are represented in a decoded tree.
enum class NumberMode : uint8_t {
  Native,      // Integer when integral and in int64 range, Double otherwise
  PreserveText // Number holding the literal text
};

// ============================================================================
// Literal table
// ============================================================================

struct LiteralForm {
  std::string_view name;
  ArgKind arg;
};

inline constexpr LiteralForm kNumberIntForm{"NumberInt", ArgKind::Int32};
inline constexpr LiteralForm kNumberLongForm{"NumberLong", ArgKind::Int64};
inline constexpr LiteralForm kNumberDecimalForm{"NumberDecimal",
                                                ArgKind::Decimal128};

inline const LiteralForm *find_literal(std::string_view name) {
  for (const LiteralForm *form :
       {&kNumberIntForm, &kNumberLongForm, &kNumberDecimalForm}) {
    if (form->name == name)
      return form;
  }
  return nullptr;
}

namespace detail {

inline int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

// Reads the 4 hex digits of a \u escape starting at s[i].
inline int32_t read_hex4(std::string_view s, size_t i) {
  if (i + 4 > s.size())
    return -1;
  int32_t r = 0;
  for (size_t k = 0; k < 4; ++k) {
    const int h = hex_value(s[i + k]);
    if (h < 0)
      return -1;
    r = (r << 4) | h;
  }
  return r;
}

template <typename Out> void append_utf8(Out &out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

constexpr uint32_t kReplacementChar = 0xFFFD;

/**
 * @brief Decodes a quoted JSON string token into UTF-8.
 *
 * Lone or mismatched surrogate escapes become U+FFFD. Returns false when
 * the token is not a well-formed string, which the validation pass rules
 * out before this is called.
 */
template <typename Out> bool unquote(std::string_view quoted, Out &out) {
  if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"')
    return false;
  const std::string_view s = quoted.substr(1, quoted.size() - 2);
  out.reserve(s.size());

  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '"' || static_cast<unsigned char>(c) < 0x20)
      return false;
    if (c != '\\') {
      out.push_back(c);
      ++i;
      continue;
    }
    if (++i >= s.size())
      return false;
    switch (s[i]) {
    case '"':
    case '\\':
    case '/':
      out.push_back(s[i]);
      ++i;
      continue;
    case 'b':
      out.push_back('\b');
      ++i;
      continue;
    case 'f':
      out.push_back('\f');
      ++i;
      continue;
    case 'n':
      out.push_back('\n');
      ++i;
      continue;
    case 'r':
      out.push_back('\r');
      ++i;
      continue;
    case 't':
      out.push_back('\t');
      ++i;
      continue;
    case 'u':
      break;
    default:
      return false;
    }

    const int32_t r = read_hex4(s, i + 1);
    if (r < 0)
      return false;
    i += 5;
    if (r >= 0xD800 && r < 0xDC00) {
      // High surrogate: only a following \u low surrogate completes it.
      if (i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
        const int32_t r2 = read_hex4(s, i + 2);
        if (r2 >= 0xDC00 && r2 < 0xE000) {
          append_utf8(out, 0x10000 + ((static_cast<uint32_t>(r) - 0xD800) << 10) +
                               (static_cast<uint32_t>(r2) - 0xDC00));
          i += 6;
          continue;
        }
      }
      append_utf8(out, kReplacementChar);
    } else if (r >= 0xDC00 && r < 0xE000) {
      append_utf8(out, kReplacementChar);
    } else {
      append_utf8(out, static_cast<uint32_t>(r));
    }
  }
  return true;
}

// Integral literal text: optional '-' then digits, no fraction or exponent.
inline bool is_integer_literal(std::string_view s) {
  return s.find_first_of(".eE") == std::string_view::npos;
}

} // namespace detail

// ============================================================================
// Decoder
// ============================================================================

class Decoder {
  std::string_view data_;
  DecodeOptions opts_;
  Allocator alloc_;

  Scanner scan_;
  size_t off_ = 0;
  ScanAction action_ = ScanAction::Continue;

public:
  explicit Decoder(std::string_view data, DecodeOptions opts = {},
                   Allocator alloc = {})
      : data_(data), opts_(opts), alloc_(alloc), scan_(opts.max_depth) {}

  /// Decodes the document into `out`; `out` is untouched on failure.
  ParseResult decode(Value &out) {
    ParseResult r = run_value(out);
    if (!r)
      log_failure(r);
    return r;
  }

  /// Decodes the document into a caller-provided destination.
  ParseResult decode(Slot &slot) {
    ParseResult r = run_slot(slot);
    if (!r)
      log_failure(r);
    return r;
  }

  /// Runs the validation pass only.
  ParseResult check_valid() const {
    Scanner scan(opts_.max_depth);
    for (size_t i = 0; i < data_.size(); ++i) {
      if (scan.step(static_cast<unsigned char>(data_[i])) == ScanAction::Error)
        return fail_at(scan.error_kind(), scan.error_message(), i);
    }
    if (scan.eof() == ScanAction::Error)
      return fail_at(scan.error_kind(), scan.error_message(), data_.size());
    return ParseResult::ok();
  }

private:
  NumberMode top_mode() const {
    return opts_.use_number ? NumberMode::PreserveText : NumberMode::Native;
  }

  void restart() {
    scan_.reset();
    off_ = 0;
    action_ = ScanAction::Continue;
  }

  ParseResult run_value(Value &out) {
    EMBER_TRY(check_valid());
    restart();
    Value result;
    EMBER_TRY(value_into(result, top_mode()));
    out = std::move(result);
    return ParseResult::ok();
  }

  ParseResult run_slot(Slot &slot) {
    EMBER_TRY(check_valid());
    restart();

    scan_while(ScanAction::SkipSpace);
    if (action_ == ScanAction::BeginLiteral && data_[off_ - 1] == 'N') {
      const size_t start = off_ - 1;
      scan_while(ScanAction::Continue);
      back_up();
      const LiteralForm *form = find_literal(data_.substr(start, off_ - start));
      if (!form)
        return phase_error();
      return store_literal(*form, slot, start);
    }
    back_up();

    const size_t start = off_;
    Value v;
    EMBER_TRY(value_into(v, top_mode()));
    ParseResult r = slot.assign(std::move(v));
    if (!r)
      return locate(std::move(r), start);
    return r;
  }

  // --------------------------------------------------------------------------
  // Scanner driving
  // --------------------------------------------------------------------------

  void scan_next() {
    if (off_ < data_.size()) {
      action_ = scan_.step(static_cast<unsigned char>(data_[off_]));
      ++off_;
    } else {
      action_ = scan_.eof();
      off_ = data_.size() + 1;
    }
  }

  // Consumes bytes while the scanner keeps returning `action`.
  void scan_while(ScanAction action) {
    while (off_ < data_.size()) {
      const ScanAction next =
          scan_.step(static_cast<unsigned char>(data_[off_]));
      ++off_;
      if (next != action) {
        action_ = next;
        return;
      }
    }
    action_ = scan_.eof();
    off_ = data_.size() + 1;
  }

  // The last byte read belongs to the next token; hand it back.
  void back_up() {
    --off_;
    scan_.undo(action_);
  }

  // --------------------------------------------------------------------------
  // Values
  // --------------------------------------------------------------------------

  ParseResult value_into(Value &out, NumberMode mode) {
    scan_while(ScanAction::SkipSpace);
    switch (action_) {
    case ScanAction::BeginArray:
      return array_into(out, mode);
    case ScanAction::BeginObject:
      return object_into(out, mode);
    case ScanAction::BeginLiteral: {
      const size_t start = off_ - 1;
      scan_while(ScanAction::Continue);
      back_up();
      return literal_into(start, data_.substr(start, off_ - start), out, mode);
    }
    default:
      return phase_error();
    }
  }

  ParseResult array_into(Value &out, NumberMode mode) {
    Array arr(alloc_);
    while (true) {
      scan_while(ScanAction::SkipSpace);
      if (action_ == ScanAction::EndArray)
        break;
      back_up();

      Value item;
      EMBER_TRY(value_into(item, mode));
      arr.push_back(std::move(item));

      scan_while(ScanAction::SkipSpace);
      if (action_ == ScanAction::EndArray)
        break;
      if (action_ != ScanAction::ArrayValue)
        return phase_error();
    }
    out = Value(std::move(arr));
    return ParseResult::ok();
  }

  ParseResult object_into(Value &out, NumberMode mode) {
    Object obj(alloc_);
    while (true) {
      scan_while(ScanAction::SkipSpace);
      if (action_ == ScanAction::EndObject)
        break;
      if (action_ != ScanAction::BeginLiteral)
        return phase_error();

      const size_t start = off_ - 1;
      scan_while(ScanAction::Continue);
      String key(alloc_);
      if (!detail::unquote(data_.substr(start, off_ - 1 - start), key))
        return phase_error();

      if (action_ == ScanAction::SkipSpace)
        scan_while(ScanAction::SkipSpace);
      if (action_ != ScanAction::ObjectKey)
        return phase_error();

      Value v;
      EMBER_TRY(value_into(v, mode));
      obj.insert(std::move(key), std::move(v));

      scan_while(ScanAction::SkipSpace);
      if (action_ == ScanAction::EndObject)
        break;
      if (action_ != ScanAction::ObjectValue)
        return phase_error();
    }
    out = Value(std::move(obj));
    return ParseResult::ok();
  }

  ParseResult literal_into(size_t start, std::string_view item, Value &out,
                           NumberMode mode) {
    switch (item.front()) {
    case 'n':
      out = Value();
      return ParseResult::ok();
    case 't':
      out = Value(true);
      return ParseResult::ok();
    case 'f':
      out = Value(false);
      return ParseResult::ok();
    case '"': {
      String s(alloc_);
      if (!detail::unquote(item, s))
        return phase_error();
      out = Value(std::move(s));
      return ParseResult::ok();
    }
    case 'N': {
      const LiteralForm *form = find_literal(item);
      if (!form)
        return phase_error();
      return get_literal(*form, out, start);
    }
    default:
      return convert_number(start, item, mode, out);
    }
  }

  ParseResult convert_number(size_t start, std::string_view item,
                             NumberMode mode, Value &out) {
    if (mode == NumberMode::PreserveText) {
      out = Value(Number(item));
      return ParseResult::ok();
    }
    if (detail::is_integer_literal(item)) {
      if (auto i = detail::parse_base10<int64_t>(item)) {
        out = Value(*i);
        return ParseResult::ok();
      }
    }
    double d = 0;
    auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), d);
    if (ec != std::errc() || ptr != item.data() + item.size())
      return fail_at(Error::Range,
                     "number " + std::string(item) + " is out of range for double",
                     start);
    out = Value(d);
    return ParseResult::ok();
  }

  // --------------------------------------------------------------------------
  // Constructors
  // --------------------------------------------------------------------------

  /// Reads `( arg, ... )` with every argument decoded as a Value.
  ParseResult dynamic_constructor(std::string_view name, NumberMode mode,
                                  Vector<Value> &args) {
    scan_while(ScanAction::SkipSpace);
    if (action_ != ScanAction::BeginCtor)
      return fail(Error::Syntax, "expected beginning of constructor");

    while (true) {
      scan_while(ScanAction::SkipSpace);
      if (action_ == ScanAction::EndCtor)
        break;
      back_up();

      Value arg;
      EMBER_TRY(value_into(arg, mode));
      args.push_back(std::move(arg));

      scan_while(ScanAction::SkipSpace);
      if (action_ == ScanAction::EndCtor)
        break;
      if (action_ != ScanAction::CtorArg)
        return phase_error();
    }
    logging::debug("{} constructor read {} argument(s)", name, args.size());
    return ParseResult::ok();
  }

  /// Reads `( arg, ... )` and coerces argument i to kinds[i].
  ParseResult typed_constructor(std::string_view name,
                                std::span<const ArgKind> kinds,
                                Vector<Value> &args) {
    Vector<Value> raw(alloc_);
    EMBER_TRY(dynamic_constructor(name, NumberMode::PreserveText, raw));
    EMBER_TRY(check_arity(name, kinds.size(), raw.size()));
    args.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
      Value typed;
      EMBER_TRY(coerce_argument(raw[i], kinds[i], name, i, typed));
      args.push_back(std::move(typed));
    }
    return ParseResult::ok();
  }

  ParseResult check_arity(std::string_view name, size_t expected,
                          size_t received) const {
    if (expected == received)
      return ParseResult::ok();
    std::string msg = "expected " + std::to_string(expected) +
                      " argument(s) in " + std::string(name) +
                      " constructor, but " + std::to_string(received) +
                      " received";
    return ParseResult::fail(Error::ArityMismatch, std::move(msg));
  }

  // Literal into a dynamic Value tree.
  ParseResult get_literal(const LiteralForm &form, Value &out, size_t start) {
    ParseResult r = ParseResult::ok();
    if (&form == &kNumberIntForm)
      r = number_int(out);
    else if (&form == &kNumberLongForm)
      r = number_long(out);
    else
      r = number_decimal(out);
    if (!r)
      return locate(std::move(r), start);
    logging::debug("decoded {} at offset {}", form.name, start);
    return r;
  }

  // Literal into a caller destination.
  ParseResult store_literal(const LiteralForm &form, Slot &slot, size_t start) {
    ParseResult r = ParseResult::ok();
    if (&form == &kNumberIntForm)
      r = store_number_int(slot);
    else if (&form == &kNumberLongForm)
      r = store_number_long(slot);
    else
      r = store_number_decimal(slot);
    if (!r)
      return locate(std::move(r), start);
    logging::debug("stored {} at offset {}", form.name, start);
    return r;
  }

  ParseResult literal_value(const LiteralForm &form, Value &out) {
    Vector<Value> args(alloc_);
    EMBER_TRY(dynamic_constructor(form.name, NumberMode::PreserveText, args));
    EMBER_TRY(check_arity(form.name, 1, args.size()));
    return coerce_argument(args[0], form.arg, form.name, 0, out);
  }

  ParseResult store_literal_value(const LiteralForm &form, Slot &slot) {
    if (!slot.accepts_dynamic())
      return ParseResult::fail(Error::DestinationType,
                               "cannot store " + std::string(form.name) +
                                   " value into " + slot.kind_name() + " type");
    const std::array<ArgKind, 1> kinds{form.arg};
    Vector<Value> args(alloc_);
    EMBER_TRY(typed_constructor(form.name, kinds, args));
    return slot.assign(std::move(args[0]));
  }

  ParseResult number_int(Value &out) { return literal_value(kNumberIntForm, out); }
  ParseResult number_long(Value &out) {
    return literal_value(kNumberLongForm, out);
  }
  ParseResult number_decimal(Value &out) {
    return literal_value(kNumberDecimalForm, out);
  }

  ParseResult store_number_int(Slot &slot) {
    return store_literal_value(kNumberIntForm, slot);
  }
  ParseResult store_number_long(Slot &slot) {
    return store_literal_value(kNumberLongForm, slot);
  }
  ParseResult store_number_decimal(Slot &slot) {
    return store_literal_value(kNumberDecimalForm, slot);
  }

  // --------------------------------------------------------------------------
  // Diagnostics
  // --------------------------------------------------------------------------

  ParseResult locate(ParseResult r, size_t offset) const {
    if (r.located())
      return r;
    offset = std::min(offset, data_.size());
    r.offset = offset;
    r.line = 1;
    size_t line_start = 0;
    for (size_t i = 0; i < offset; ++i) {
      if (data_[i] == '\n') {
        ++r.line;
        line_start = i + 1;
      }
    }
    r.column = offset - line_start + 1;
    return r;
  }

  ParseResult fail_at(Error e, std::string msg, size_t offset) const {
    return locate(ParseResult::fail(e, std::move(msg)), offset);
  }

  // Failure at the byte just read.
  ParseResult fail(Error e, std::string msg) const {
    return fail_at(e, std::move(msg), off_ == 0 ? 0 : off_ - 1);
  }

  // The second pass disagrees with the validation pass.
  ParseResult phase_error() const {
    return fail(Error::Syntax, "JSON decoder out of sync");
  }

  void log_failure(const ParseResult &r) const {
    logging::debug("decode failed at line {}, column {}: {}", r.line, r.column,
                   r.message);
  }
};

} // namespace json
} // namespace ember

#endif // EMBER_JSON_DECODER_HPP
