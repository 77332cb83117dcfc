/**
 * @file scanner.hpp
 * @brief Ember JSON - byte-at-a-time scanner for the extended JSON dialect
 *
 * The scanner is a state machine fed one byte at a time. Each step returns a
 * ScanAction telling the caller what the byte did (began a value, ended an
 * array, was whitespace...). The decoder uses it twice: once to validate the
 * whole input, then again while building values, backing up one byte where
 * it needs lookahead.
 *
 * Constructor literals share a prefix with nothing in plain JSON, so the
 * dialect costs one extra entry in BeginValue ('N'):
 *
 *   N -> UpperN -u-> UpperNu -m-> "ber" -> AfterNumber
 *   AfterNumber -I-> "nt"     -> Constructor
 *               -L-> "ong"    -> Constructor
 *               -D-> "ecimal" -> Constructor
 *   Constructor -(-> BeginCtorOrEmpty ... ) -> EndValue
 *
 * License: MIT
 */

#ifndef EMBER_JSON_SCANNER_HPP
#define EMBER_JSON_SCANNER_HPP

#include "ember_json/base.hpp"
#include "ember_json/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ember {
namespace json {

constexpr size_t kDefaultMaxDepth = 10000;

enum class ScanAction : uint8_t {
  Continue,     // Uninteresting byte
  BeginLiteral, // First byte of a string, number, keyword or constructor
  BeginObject,
  ObjectKey,   // ':' after an object key
  ObjectValue, // ',' after an object member
  EndObject,
  BeginArray,
  ArrayValue, // ',' after an array element
  EndArray,
  BeginCtor, // '(' after a constructor keyword
  CtorArg,   // ',' after a constructor argument
  EndCtor,
  SkipSpace,
  End, // Top-level value ended before this byte
  Error
};

enum class ScanState : uint8_t {
  BeginValue,
  BeginValueOrEmpty,
  BeginStringOrEmpty,
  BeginString,
  BeginCtorOrEmpty,
  EndValue,
  EndTop,
  InString,
  InStringEsc,
  InStringEscU,
  InStringEscU1,
  InStringEscU12,
  InStringEscU123,
  Neg,
  One,
  Zero,
  Dot,
  Dot0,
  E,
  ESign,
  E0,
  UpperN,
  UpperNu,
  AfterNumber,
  Keyword,
  Constructor,
  Redo,
  Error
};

enum class ParseContext : uint8_t { ObjectKey, ObjectValue, ArrayValue, CtorArg };

// ============================================================================
// Keyword chains
// ============================================================================

/**
 * @brief Immutable matcher for the tail of a keyword.
 *
 * `expected` holds the bytes still to come once the scanner has committed to
 * `keyword`; after the last one the scanner moves to `next`. Chains carry no
 * cursor, so a single instance serves every scanner on every thread.
 */
struct KeywordChain {
  std::string_view keyword;
  std::string_view expected;
  ScanState next;

  friend constexpr bool operator==(const KeywordChain &,
                                   const KeywordChain &) = default;
};

constexpr KeywordChain make_keyword_chain(std::string_view keyword,
                                          std::string_view expected,
                                          ScanState next) {
  return KeywordChain{keyword, expected, next};
}

inline constexpr KeywordChain kNumberChain =
    make_keyword_chain("Number", "ber", ScanState::AfterNumber);
inline constexpr KeywordChain kNumberIntChain =
    make_keyword_chain("NumberInt", "nt", ScanState::Constructor);
inline constexpr KeywordChain kNumberLongChain =
    make_keyword_chain("NumberLong", "ong", ScanState::Constructor);
inline constexpr KeywordChain kNumberDecimalChain =
    make_keyword_chain("NumberDecimal", "ecimal", ScanState::Constructor);
inline constexpr KeywordChain kTrueChain =
    make_keyword_chain("true", "rue", ScanState::EndValue);
inline constexpr KeywordChain kFalseChain =
    make_keyword_chain("false", "alse", ScanState::EndValue);
inline constexpr KeywordChain kNullChain =
    make_keyword_chain("null", "ull", ScanState::EndValue);

namespace detail {

inline bool is_space(int c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

inline bool is_digit(int c) { return c >= '0' && c <= '9'; }

inline bool is_hex(int c) {
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Renders a byte for a diagnostic: 'x', '\'', '"' or '\x1f'.
inline std::string quote_char(int c) {
  if (c == '\'')
    return "'\\''";
  if (c >= 0x20 && c < 0x7F)
    return std::string{'\'', static_cast<char>(c), '\''};
  static constexpr char kHex[] = "0123456789abcdef";
  const auto b = static_cast<unsigned char>(c);
  return std::string{'\'', '\\', 'x', kHex[b >> 4], kHex[b & 0xF], '\''};
}

} // namespace detail

// ============================================================================
// Scanner
// ============================================================================

class Scanner {
  ScanState state_ = ScanState::BeginValue;
  std::vector<ParseContext> stack_;
  size_t max_depth_;

  const KeywordChain *chain_ = nullptr;
  size_t chain_pos_ = 0;

  bool end_top_ = false;
  bool redo_ = false;
  ScanAction redo_action_ = ScanAction::Continue;
  ScanState redo_state_ = ScanState::BeginValue;

  Error error_kind_ = Error::Ok;
  std::string error_message_;

public:
  explicit Scanner(size_t max_depth = kDefaultMaxDepth)
      : max_depth_(max_depth) {}

  /// Prepares the scanner for a new top-level value.
  void reset() {
    state_ = ScanState::BeginValue;
    stack_.clear();
    chain_ = nullptr;
    chain_pos_ = 0;
    end_top_ = false;
    redo_ = false;
    error_kind_ = Error::Ok;
    error_message_.clear();
  }

  /// Feeds one byte (0..255).
  ScanAction step(int c) {
    switch (state_) {
    case ScanState::BeginValue:
      return begin_value(c);
    case ScanState::BeginValueOrEmpty:
      if (detail::is_space(c))
        return ScanAction::SkipSpace;
      if (c == ']')
        return end_value(c);
      return begin_value(c);
    case ScanState::BeginStringOrEmpty:
      if (detail::is_space(c))
        return ScanAction::SkipSpace;
      if (c == '}') {
        stack_.back() = ParseContext::ObjectValue;
        return end_value(c);
      }
      return begin_string(c);
    case ScanState::BeginString:
      return begin_string(c);
    case ScanState::BeginCtorOrEmpty:
      if (detail::is_space(c))
        return ScanAction::SkipSpace;
      if (c == ')')
        return end_value(c);
      return begin_value(c);
    case ScanState::EndValue:
      return end_value(c);
    case ScanState::EndTop:
      return end_top(c);
    case ScanState::InString:
      return in_string(c);
    case ScanState::InStringEsc:
      return in_string_esc(c);
    case ScanState::InStringEscU:
      return in_string_esc_u(c, ScanState::InStringEscU1);
    case ScanState::InStringEscU1:
      return in_string_esc_u(c, ScanState::InStringEscU12);
    case ScanState::InStringEscU12:
      return in_string_esc_u(c, ScanState::InStringEscU123);
    case ScanState::InStringEscU123:
      return in_string_esc_u(c, ScanState::InString);
    case ScanState::Neg:
      if (c == '0') {
        state_ = ScanState::Zero;
        return ScanAction::Continue;
      }
      if (c >= '1' && c <= '9') {
        state_ = ScanState::One;
        return ScanAction::Continue;
      }
      return fail(c, "in numeric literal");
    case ScanState::One:
      if (detail::is_digit(c))
        return ScanAction::Continue;
      return after_integer(c);
    case ScanState::Zero:
      return after_integer(c);
    case ScanState::Dot:
      if (detail::is_digit(c)) {
        state_ = ScanState::Dot0;
        return ScanAction::Continue;
      }
      return fail(c, "after decimal point in numeric literal");
    case ScanState::Dot0:
      if (detail::is_digit(c))
        return ScanAction::Continue;
      if (c == 'e' || c == 'E') {
        state_ = ScanState::E;
        return ScanAction::Continue;
      }
      return end_value(c);
    case ScanState::E:
      if (c == '+' || c == '-') {
        state_ = ScanState::ESign;
        return ScanAction::Continue;
      }
      [[fallthrough]];
    case ScanState::ESign:
      if (detail::is_digit(c)) {
        state_ = ScanState::E0;
        return ScanAction::Continue;
      }
      return fail(c, "in exponent of numeric literal");
    case ScanState::E0:
      if (detail::is_digit(c))
        return ScanAction::Continue;
      return end_value(c);
    case ScanState::UpperN:
      if (c == 'u') {
        state_ = ScanState::UpperNu;
        return ScanAction::Continue;
      }
      return fail(c, "in literal Number (expecting 'u')");
    case ScanState::UpperNu:
      if (c == 'm')
        return begin_chain(kNumberChain);
      return fail(c, "in literal Number (expecting 'm')");
    case ScanState::AfterNumber:
      switch (c) {
      case 'I':
        return begin_chain(kNumberIntChain);
      case 'L':
        return begin_chain(kNumberLongChain);
      case 'D':
        return begin_chain(kNumberDecimalChain);
      default:
        return fail(c, "in literal NumberInt, NumberLong or NumberDecimal "
                       "(expecting 'I', 'L' or 'D')");
      }
    case ScanState::Keyword:
      return in_keyword(c);
    case ScanState::Constructor:
      if (detail::is_space(c))
        return ScanAction::SkipSpace;
      if (c == '(') {
        state_ = ScanState::BeginCtorOrEmpty;
        return push(ParseContext::CtorArg, ScanAction::BeginCtor);
      }
      return fail(c, "in constructor (expecting '(')");
    case ScanState::Redo:
      redo_ = false;
      state_ = redo_state_;
      return redo_action_;
    case ScanState::Error:
      return ScanAction::Error;
    }
    return ScanAction::Error;
  }

  /**
   * @brief Signals the end of input.
   *
   * Returns End when the input held exactly one complete value, Error
   * otherwise (Error::UnexpectedEnd unless a byte already failed).
   */
  ScanAction eof() {
    if (error_kind_ != Error::Ok)
      return ScanAction::Error;
    if (end_top_)
      return ScanAction::End;
    step(' ');
    if (end_top_)
      return ScanAction::End;
    // A value cut short, whatever the padding byte made of it.
    error_kind_ = Error::UnexpectedEnd;
    error_message_ = "unexpected end of JSON input";
    state_ = ScanState::Error;
    return ScanAction::Error;
  }

  /// Makes the next step() return `action` again without consuming a byte.
  /// Only one step can be undone.
  void undo(ScanAction action) {
    redo_ = true;
    redo_action_ = action;
    redo_state_ = state_;
    state_ = ScanState::Redo;
  }

  bool can_undo() const { return !redo_; }

  ScanState state() const { return state_; }
  size_t depth() const { return stack_.size(); }
  size_t max_depth() const { return max_depth_; }

  Error error_kind() const { return error_kind_; }
  const std::string &error_message() const { return error_message_; }

private:
  ScanAction begin_value(int c) {
    if (detail::is_space(c))
      return ScanAction::SkipSpace;
    switch (c) {
    case '{':
      state_ = ScanState::BeginStringOrEmpty;
      return push(ParseContext::ObjectKey, ScanAction::BeginObject);
    case '[':
      state_ = ScanState::BeginValueOrEmpty;
      return push(ParseContext::ArrayValue, ScanAction::BeginArray);
    case '"':
      state_ = ScanState::InString;
      return ScanAction::BeginLiteral;
    case '-':
      state_ = ScanState::Neg;
      return ScanAction::BeginLiteral;
    case '0':
      state_ = ScanState::Zero;
      return ScanAction::BeginLiteral;
    case 't':
      begin_chain(kTrueChain);
      return ScanAction::BeginLiteral;
    case 'f':
      begin_chain(kFalseChain);
      return ScanAction::BeginLiteral;
    case 'n':
      begin_chain(kNullChain);
      return ScanAction::BeginLiteral;
    case 'N':
      state_ = ScanState::UpperN;
      return ScanAction::BeginLiteral;
    default:
      break;
    }
    if (c >= '1' && c <= '9') {
      state_ = ScanState::One;
      return ScanAction::BeginLiteral;
    }
    return fail(c, "looking for beginning of value");
  }

  ScanAction begin_string(int c) {
    if (detail::is_space(c))
      return ScanAction::SkipSpace;
    if (c == '"') {
      state_ = ScanState::InString;
      return ScanAction::BeginLiteral;
    }
    return fail(c, "looking for beginning of object key string");
  }

  ScanAction end_value(int c) {
    if (stack_.empty()) {
      state_ = ScanState::EndTop;
      end_top_ = true;
      return end_top(c);
    }
    if (detail::is_space(c)) {
      state_ = ScanState::EndValue;
      return ScanAction::SkipSpace;
    }
    switch (stack_.back()) {
    case ParseContext::ObjectKey:
      if (c == ':') {
        stack_.back() = ParseContext::ObjectValue;
        state_ = ScanState::BeginValue;
        return ScanAction::ObjectKey;
      }
      return fail(c, "after object key");
    case ParseContext::ObjectValue:
      if (c == ',') {
        stack_.back() = ParseContext::ObjectKey;
        state_ = ScanState::BeginString;
        return ScanAction::ObjectValue;
      }
      if (c == '}') {
        pop();
        return ScanAction::EndObject;
      }
      return fail(c, "after object key:value pair");
    case ParseContext::ArrayValue:
      if (c == ',') {
        state_ = ScanState::BeginValue;
        return ScanAction::ArrayValue;
      }
      if (c == ']') {
        pop();
        return ScanAction::EndArray;
      }
      return fail(c, "after array element");
    case ParseContext::CtorArg:
      if (c == ',') {
        state_ = ScanState::BeginValue;
        return ScanAction::CtorArg;
      }
      if (c == ')') {
        pop();
        return ScanAction::EndCtor;
      }
      return fail(c, "after constructor argument");
    }
    return fail(c, "after value");
  }

  ScanAction end_top(int c) {
    if (!detail::is_space(c))
      return fail(c, "after top-level value");
    return ScanAction::End;
  }

  ScanAction after_integer(int c) {
    if (c == '.') {
      state_ = ScanState::Dot;
      return ScanAction::Continue;
    }
    if (c == 'e' || c == 'E') {
      state_ = ScanState::E;
      return ScanAction::Continue;
    }
    return end_value(c);
  }

  ScanAction in_string(int c) {
    if (c == '"') {
      state_ = ScanState::EndValue;
      return ScanAction::Continue;
    }
    if (c == '\\') {
      state_ = ScanState::InStringEsc;
      return ScanAction::Continue;
    }
    if (c < 0x20)
      return fail(c, "in string literal");
    return ScanAction::Continue;
  }

  ScanAction in_string_esc(int c) {
    switch (c) {
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
    case '\\':
    case '/':
    case '"':
      state_ = ScanState::InString;
      return ScanAction::Continue;
    case 'u':
      state_ = ScanState::InStringEscU;
      return ScanAction::Continue;
    default:
      return fail(c, "in string escape code");
    }
  }

  ScanAction in_string_esc_u(int c, ScanState next) {
    if (detail::is_hex(c)) {
      state_ = next;
      return ScanAction::Continue;
    }
    return fail(c, "in \\u hexadecimal character escape");
  }

  ScanAction begin_chain(const KeywordChain &chain) {
    chain_ = &chain;
    chain_pos_ = 0;
    state_ = ScanState::Keyword;
    return ScanAction::Continue;
  }

  ScanAction in_keyword(int c) {
    const std::string_view want = chain_->expected;
    if (c != static_cast<unsigned char>(want[chain_pos_])) {
      std::string context = "in literal ";
      context += chain_->keyword;
      context += " (expecting '";
      context += want[chain_pos_];
      context += "')";
      return fail(c, context);
    }
    if (++chain_pos_ == want.size()) {
      state_ = chain_->next;
      chain_ = nullptr;
      chain_pos_ = 0;
    }
    return ScanAction::Continue;
  }

  ScanAction push(ParseContext ctx, ScanAction action) {
    if (EMBER_UNLIKELY(stack_.size() >= max_depth_)) {
      state_ = ScanState::Error;
      error_kind_ = Error::DepthExceeded;
      error_message_ = "exceeded max depth";
      return ScanAction::Error;
    }
    stack_.push_back(ctx);
    return action;
  }

  void pop() {
    stack_.pop_back();
    if (stack_.empty()) {
      state_ = ScanState::EndTop;
      end_top_ = true;
    } else {
      state_ = ScanState::EndValue;
    }
  }

  ScanAction fail(int c, std::string_view context) {
    state_ = ScanState::Error;
    error_kind_ = Error::Syntax;
    error_message_ = "invalid character " + detail::quote_char(c) + " ";
    error_message_ += context;
    return ScanAction::Error;
  }
};

} // namespace json
} // namespace ember

#endif // EMBER_JSON_SCANNER_HPP
