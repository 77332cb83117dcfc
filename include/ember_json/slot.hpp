/**
 * @file slot.hpp
 * @brief Ember JSON - decode destinations
 *
 * A Slot is where the decoder deposits the top-level value. DynamicSlot
 * takes any Value, typed literals included. FixedSlot<T> binds a plain C++
 * variable and only takes the JSON kinds that convert to T; typed literals
 * are refused before their arguments are read.
 *
 * License: MIT
 */

#ifndef EMBER_JSON_SLOT_HPP
#define EMBER_JSON_SLOT_HPP

#include "ember_json/error.hpp"
#include "ember_json/value.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace ember {
namespace json {

class Slot {
public:
  virtual ~Slot() = default;

  /// True when the slot can hold a Value of any kind.
  virtual bool accepts_dynamic() const = 0;

  /// Name of the destination type, for diagnostics.
  virtual const char *kind_name() const = 0;

  virtual ParseResult assign(Value &&v) = 0;
};

class DynamicSlot final : public Slot {
  Value &target_;

public:
  explicit DynamicSlot(Value &target) : target_(target) {}

  bool accepts_dynamic() const override { return true; }
  const char *kind_name() const override { return "value"; }

  ParseResult assign(Value &&v) override {
    target_ = std::move(v);
    return ParseResult::ok();
  }
};

namespace detail {

inline ParseResult cannot_store(const Value &v, const char *kind) {
  return ParseResult::fail(Error::TypeMismatch,
                           std::string("cannot store ") + v.type_name() +
                               " value into " + kind + " type");
}

inline ParseResult overflows(const Value &v, const char *kind) {
  std::string text = v.is_number() ? v.as_number().str()
                                   : std::to_string(v.as_int64());
  return ParseResult::fail(Error::Range,
                           "value " + text + " overflows " + kind);
}

// Optional '-' followed by digits only.
inline bool is_integral_text(std::string_view s) {
  if (!s.empty() && s.front() == '-')
    s.remove_prefix(1);
  if (s.empty())
    return false;
  for (char c : s)
    if (c < '0' || c > '9')
      return false;
  return true;
}

} // namespace detail

template <typename T> struct slot_traits;

template <> struct slot_traits<bool> {
  static constexpr const char *name = "bool";

  static ParseResult convert(const Value &v, bool &out) {
    if (!v.is_bool())
      return detail::cannot_store(v, name);
    out = v.as_bool();
    return ParseResult::ok();
  }
};

template <> struct slot_traits<int64_t> {
  static constexpr const char *name = "int64";

  static ParseResult convert(const Value &v, int64_t &out) {
    if (!v.is_integer() && !v.is_number())
      return detail::cannot_store(v, name);
    auto i = v.get_int64();
    if (!i)
      return detail::is_integral_text(v.as_number().str())
                 ? detail::overflows(v, name)
                 : detail::cannot_store(v, name);
    out = *i;
    return ParseResult::ok();
  }
};

template <> struct slot_traits<int32_t> {
  static constexpr const char *name = "int32";

  static ParseResult convert(const Value &v, int32_t &out) {
    int64_t wide = 0;
    ParseResult r = slot_traits<int64_t>::convert(v, wide);
    if (!r) {
      if (r.error == Error::Range)
        return detail::overflows(v, name);
      return detail::cannot_store(v, name);
    }
    if (wide < std::numeric_limits<int32_t>::min() ||
        wide > std::numeric_limits<int32_t>::max())
      return detail::overflows(v, name);
    out = static_cast<int32_t>(wide);
    return ParseResult::ok();
  }
};

template <> struct slot_traits<double> {
  static constexpr const char *name = "double";

  static ParseResult convert(const Value &v, double &out) {
    if (!v.is_double() && !v.is_integer() && !v.is_number())
      return detail::cannot_store(v, name);
    auto d = v.get_double();
    if (!d)
      return detail::cannot_store(v, name);
    out = *d;
    return ParseResult::ok();
  }
};

template <> struct slot_traits<std::string> {
  static constexpr const char *name = "string";

  static ParseResult convert(const Value &v, std::string &out) {
    if (!v.is_string())
      return detail::cannot_store(v, name);
    out.assign(v.as_string_view());
    return ParseResult::ok();
  }
};

/**
 * @brief Slot bound to a variable of a fixed C++ type.
 *
 * Supported types: bool, int32_t, int64_t, double, std::string. The
 * variable is left untouched when the conversion fails.
 */
template <typename T> class FixedSlot final : public Slot {
  T &target_;

public:
  explicit FixedSlot(T &target) : target_(target) {}

  bool accepts_dynamic() const override { return false; }
  const char *kind_name() const override { return slot_traits<T>::name; }

  ParseResult assign(Value &&v) override {
    T tmp{};
    EMBER_TRY(slot_traits<T>::convert(v, tmp));
    target_ = std::move(tmp);
    return ParseResult::ok();
  }
};

} // namespace json
} // namespace ember

#endif // EMBER_JSON_SLOT_HPP
