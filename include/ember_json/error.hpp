/**
 * @file error.hpp
 * @brief Ember JSON - error kinds, decode results and exceptions
 *
 * Decoding never throws internally: every step returns a ParseResult and
 * the first failure is propagated unchanged to the caller. Only the
 * convenience API (parse(), Value::as_*) converts failures to exceptions.
 *
 * License: MIT
 */

#ifndef EMBER_JSON_ERROR_HPP
#define EMBER_JSON_ERROR_HPP

#include "ember_json/base.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ember {
namespace json {

enum class Error {
  Ok = 0,
  Syntax,          // Unexpected character while scanning
  UnexpectedEnd,   // Input ended inside a value
  ArityMismatch,   // Wrong number of constructor arguments
  ArgumentType,    // Constructor argument is neither a number nor a string
  Range,           // Numeric text does not fit the target integer
  DecimalParse,    // Text rejected by the decimal128 parser
  DestinationType, // Literal cannot be stored into a fixed-type slot
  TypeMismatch,    // Plain value cannot be converted to a fixed-type slot
  DepthExceeded
};

inline const char *error_message(Error e) {
  switch (e) {
  case Error::Ok:
    return "No error";
  case Error::Syntax:
    return "Syntax error";
  case Error::UnexpectedEnd:
    return "Unexpected end of input";
  case Error::ArityMismatch:
    return "Constructor arity mismatch";
  case Error::ArgumentType:
    return "Constructor argument type mismatch";
  case Error::Range:
    return "Number out of range";
  case Error::DecimalParse:
    return "Invalid decimal128";
  case Error::DestinationType:
    return "Destination type mismatch";
  case Error::TypeMismatch:
    return "Type mismatch";
  case Error::DepthExceeded:
    return "Nesting depth too high";
  default:
    return "Unknown error";
  }
}

// ============================================================================
// ParseResult
// ============================================================================

/**
 * @brief Outcome of a scan or decode step.
 *
 * line and column are 1-based and stay 0 until the decoder attaches the
 * position of the failure.
 */
struct ParseResult {
  Error error = Error::Ok;
  std::string message;
  size_t offset = 0;
  size_t line = 0;
  size_t column = 0;

  static ParseResult ok() { return {}; }

  static ParseResult fail(Error e, std::string msg) {
    ParseResult r;
    r.error = e;
    r.message = std::move(msg);
    return r;
  }

  bool located() const { return line > 0; }

  explicit operator bool() const { return error == Error::Ok; }
};

// Propagates a failed ParseResult out of the enclosing function.
#define EMBER_TRY(expr)                                                        \
  do {                                                                         \
    ::ember::json::ParseResult ember_try_result_ = (expr);                     \
    if (EMBER_UNLIKELY(!ember_try_result_))                                    \
      return ember_try_result_;                                                \
  } while (0)

// ============================================================================
// Exceptions
// ============================================================================

class ParseError : public std::runtime_error {
public:
  Error code;
  size_t line, column, offset;

  ParseError(const std::string &msg, size_t l = 0, size_t c = 0, size_t off = 0,
             Error e = Error::Syntax)
      : std::runtime_error(msg), code(e), line(l), column(c), offset(off) {}

  explicit ParseError(const ParseResult &r)
      : ParseError(r.message, r.line, r.column, r.offset, r.error) {}

  std::string format() const {
    std::ostringstream oss;
    if (line > 0) {
      oss << "Parse error at line " << line << ", column " << column << ": ";
    } else {
      oss << "Parse error: ";
    }
    oss << what();
    return oss.str();
  }
};

class TypeError : public std::runtime_error {
public:
  TypeError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace json
} // namespace ember

#endif // EMBER_JSON_ERROR_HPP
