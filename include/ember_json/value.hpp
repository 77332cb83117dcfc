/**
 * @file value.hpp
 * @brief Ember JSON - dynamically typed document values
 *
 * License: MIT
 */

#ifndef EMBER_JSON_VALUE_HPP
#define EMBER_JSON_VALUE_HPP

#include "ember_json/base.hpp"
#include "ember_json/decimal128.hpp"
#include "ember_json/error.hpp"
#include "ember_json/number.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ember {
namespace json {

// ============================================================================
// Typed Literal Values
// ============================================================================

/// Value of a NumberInt(...) literal.
struct NumberInt {
  int32_t value = 0;
  friend bool operator==(const NumberInt &, const NumberInt &) = default;
};

/// Value of a NumberLong(...) literal.
struct NumberLong {
  int64_t value = 0;
  friend bool operator==(const NumberLong &, const NumberLong &) = default;
};

enum class ValueType : uint8_t {
  Null = 0,
  Boolean,
  Integer, // Plain JSON integer that fits int64
  Double,  // Any other plain JSON number
  String,
  Number, // Number kept as source text
  NumberInt,
  NumberLong,
  NumberDecimal,
  Array,
  Object
};

inline const char *type_name(ValueType t) {
  switch (t) {
  case ValueType::Null:
    return "null";
  case ValueType::Boolean:
    return "bool";
  case ValueType::Integer:
    return "int64";
  case ValueType::Double:
    return "double";
  case ValueType::String:
    return "string";
  case ValueType::Number:
    return "Number";
  case ValueType::NumberInt:
    return "NumberInt";
  case ValueType::NumberLong:
    return "NumberLong";
  case ValueType::NumberDecimal:
    return "NumberDecimal";
  case ValueType::Array:
    return "array";
  case ValueType::Object:
    return "object";
  }
  return "unknown";
}

// ============================================================================
// Containers
// ============================================================================

class Value;
struct Member;

class Array {
  Vector<Value> items_;

public:
  using iterator = Vector<Value>::iterator;
  using const_iterator = Vector<Value>::const_iterator;

  explicit Array(Allocator alloc = {});
  Array(const Array &other, Allocator alloc);

  void push_back(const Value &v);
  void push_back(Value &&v);
  void reserve(size_t n);
  size_t size() const;
  bool empty() const;

  Value &operator[](size_t index);
  const Value &operator[](size_t index) const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;
};

// Keys keep insertion order; duplicates are preserved as written.
class Object {
  Vector<Member> fields_;

public:
  using iterator = Vector<Member>::iterator;
  using const_iterator = Vector<Member>::const_iterator;

  explicit Object(Allocator alloc = {});
  Object(const Object &other, Allocator alloc);

  void insert(String key, Value value);
  bool contains(std::string_view key) const;

  // Last occurrence wins for duplicated keys.
  const Value *find(std::string_view key) const;
  Value *find(std::string_view key);

  const Value &operator[](std::string_view key) const;

  size_t size() const;
  bool empty() const;

  iterator begin();
  iterator end();
  const_iterator begin() const;
  const_iterator end() const;
};

// ============================================================================
// Value
// ============================================================================

class Value {
  ValueType type_;

  union {
    bool bool_val;
    int64_t int_val;
    double double_val;
    NumberInt number_int_val;
    NumberLong number_long_val;
    Decimal128 decimal_val;
    String string_val;
    Number number_val;
    Array array_val;
    Object object_val;
  };

public:
  Value() : type_(ValueType::Null) {}
  Value(std::nullptr_t) : type_(ValueType::Null) {}
  Value(bool b) : type_(ValueType::Boolean), bool_val(b) {}
  Value(int i) : type_(ValueType::Integer), int_val(i) {}
  Value(long i) : type_(ValueType::Integer), int_val(i) {}
  Value(long long i) : type_(ValueType::Integer), int_val(i) {}
  Value(double d) : type_(ValueType::Double), double_val(d) {}

  Value(const char *s, Allocator alloc = {}) : type_(ValueType::String) {
    new (&string_val) String(s, alloc);
  }
  Value(std::string_view sv, Allocator alloc = {}) : type_(ValueType::String) {
    new (&string_val) String(sv, alloc);
  }
  Value(const std::string &s, Allocator alloc = {}) : type_(ValueType::String) {
    new (&string_val) String(s.data(), s.size(), alloc);
  }
  Value(const String &s) : type_(ValueType::String) {
    new (&string_val) String(s);
  }
  Value(String &&s) : type_(ValueType::String) {
    new (&string_val) String(std::move(s));
  }

  Value(Number n) : type_(ValueType::Number) {
    new (&number_val) Number(std::move(n));
  }
  Value(NumberInt n) : type_(ValueType::NumberInt), number_int_val(n) {}
  Value(NumberLong n) : type_(ValueType::NumberLong), number_long_val(n) {}
  Value(const Decimal128 &d) : type_(ValueType::NumberDecimal) {
    new (&decimal_val) Decimal128(d);
  }

  Value(Array &&a) : type_(ValueType::Array) {
    new (&array_val) Array(std::move(a));
  }
  Value(const Array &a) : type_(ValueType::Array) { new (&array_val) Array(a); }
  Value(Object &&o) : type_(ValueType::Object) {
    new (&object_val) Object(std::move(o));
  }
  Value(const Object &o) : type_(ValueType::Object) {
    new (&object_val) Object(o);
  }

  static Value array(Allocator alloc = {}) { return Value(Array(alloc)); }
  static Value object(Allocator alloc = {}) { return Value(Object(alloc)); }

  Value(const Value &other) : type_(other.type_) { copy_from(other); }
  Value(Value &&other) noexcept : type_(other.type_) {
    move_from(std::move(other));
  }

  // Copies use the default memory resource; moves keep the source's.
  Value &operator=(const Value &other) {
    if (this != &other) {
      destroy();
      type_ = other.type_;
      copy_from(other);
    }
    return *this;
  }

  Value &operator=(Value &&other) noexcept {
    if (this != &other) {
      destroy();
      type_ = other.type_;
      move_from(std::move(other));
    }
    return *this;
  }

  ~Value() { destroy(); }

  ValueType type() const { return type_; }
  const char *type_name() const { return json::type_name(type_); }

  bool is_null() const { return type_ == ValueType::Null; }
  bool is_bool() const { return type_ == ValueType::Boolean; }
  bool is_integer() const { return type_ == ValueType::Integer; }
  bool is_double() const { return type_ == ValueType::Double; }
  bool is_string() const { return type_ == ValueType::String; }
  bool is_number() const { return type_ == ValueType::Number; }
  bool is_number_int() const { return type_ == ValueType::NumberInt; }
  bool is_number_long() const { return type_ == ValueType::NumberLong; }
  bool is_decimal128() const { return type_ == ValueType::NumberDecimal; }
  bool is_array() const { return type_ == ValueType::Array; }
  bool is_object() const { return type_ == ValueType::Object; }

  std::optional<bool> get_bool() const {
    return is_bool() ? std::optional<bool>(bool_val) : std::nullopt;
  }

  std::optional<int32_t> get_number_int() const {
    if (is_number_int())
      return number_int_val.value;
    return std::nullopt;
  }

  std::optional<int64_t> get_number_long() const {
    if (is_number_long())
      return number_long_val.value;
    return std::nullopt;
  }

  // Any integral kind, widened to int64.
  std::optional<int64_t> get_int64() const {
    switch (type_) {
    case ValueType::Integer:
      return int_val;
    case ValueType::NumberInt:
      return number_int_val.value;
    case ValueType::NumberLong:
      return number_long_val.value;
    case ValueType::Number:
      return number_val.int64();
    default:
      return std::nullopt;
    }
  }

  std::optional<double> get_double() const {
    switch (type_) {
    case ValueType::Double:
      return double_val;
    case ValueType::Integer:
      return static_cast<double>(int_val);
    case ValueType::NumberInt:
      return static_cast<double>(number_int_val.value);
    case ValueType::NumberLong:
      return static_cast<double>(number_long_val.value);
    case ValueType::Number:
      return number_val.float64();
    default:
      return std::nullopt;
    }
  }

  bool as_bool() const {
    if (!is_bool())
      throw TypeError("Not a boolean");
    return bool_val;
  }

  int64_t as_int64() const {
    auto v = get_int64();
    if (!v)
      throw TypeError("Not an integer");
    return *v;
  }

  double as_double() const {
    auto v = get_double();
    if (!v)
      throw TypeError("Not a number");
    return *v;
  }

  int32_t as_number_int() const {
    if (!is_number_int())
      throw TypeError("Not a NumberInt");
    return number_int_val.value;
  }

  int64_t as_number_long() const {
    if (!is_number_long())
      throw TypeError("Not a NumberLong");
    return number_long_val.value;
  }

  const Decimal128 &as_decimal128() const {
    if (!is_decimal128())
      throw TypeError("Not a NumberDecimal");
    return decimal_val;
  }

  const Number &as_number() const {
    if (!is_number())
      throw TypeError("Not a Number");
    return number_val;
  }

  const String &as_string() const {
    if (!is_string())
      throw TypeError("Value is not a string");
    return string_val;
  }

  std::string_view as_string_view() const {
    if (is_string())
      return string_val;
    return {};
  }

  Array &as_array() {
    if (!is_array())
      throw TypeError("Not an array");
    return array_val;
  }
  const Array &as_array() const {
    if (!is_array())
      throw TypeError("Not an array");
    return array_val;
  }

  Object &as_object() {
    if (!is_object())
      throw TypeError("Not an object");
    return object_val;
  }
  const Object &as_object() const {
    if (!is_object())
      throw TypeError("Not an object");
    return object_val;
  }

  const Value &operator[](size_t index) const;
  const Value &operator[](std::string_view key) const;

  size_t size() const {
    if (is_array())
      return array_val.size();
    if (is_object())
      return object_val.size();
    return 0;
  }

private:
  void destroy();
  void copy_from(const Value &other);
  void move_from(Value &&other);
};

struct Member {
  String key;
  Value value;
};

// ============================================================================
// Out-of-line Definitions
// ============================================================================

inline void Value::destroy() {
  switch (type_) {
  case ValueType::String:
    string_val.~String();
    break;
  case ValueType::Number:
    number_val.~Number();
    break;
  case ValueType::Array:
    array_val.~Array();
    break;
  case ValueType::Object:
    object_val.~Object();
    break;
  default:
    break;
  }
  type_ = ValueType::Null;
}

inline void Value::copy_from(const Value &other) {
  switch (other.type_) {
  case ValueType::Null:
    break;
  case ValueType::Boolean:
    bool_val = other.bool_val;
    break;
  case ValueType::Integer:
    int_val = other.int_val;
    break;
  case ValueType::Double:
    double_val = other.double_val;
    break;
  case ValueType::NumberInt:
    number_int_val = other.number_int_val;
    break;
  case ValueType::NumberLong:
    number_long_val = other.number_long_val;
    break;
  case ValueType::NumberDecimal:
    new (&decimal_val) Decimal128(other.decimal_val);
    break;
  case ValueType::String:
    new (&string_val) String(other.string_val);
    break;
  case ValueType::Number:
    new (&number_val) Number(other.number_val);
    break;
  case ValueType::Array:
    new (&array_val) Array(other.array_val);
    break;
  case ValueType::Object:
    new (&object_val) Object(other.object_val);
    break;
  }
}

inline void Value::move_from(Value &&other) {
  switch (other.type_) {
  case ValueType::String:
    new (&string_val) String(std::move(other.string_val));
    break;
  case ValueType::Number:
    new (&number_val) Number(std::move(other.number_val));
    break;
  case ValueType::Array:
    new (&array_val) Array(std::move(other.array_val));
    break;
  case ValueType::Object:
    new (&object_val) Object(std::move(other.object_val));
    break;
  default:
    copy_from(other);
    return;
  }
  other.destroy();
}

inline Array::Array(Allocator alloc) : items_(alloc) {}
inline Array::Array(const Array &other, Allocator alloc)
    : items_(other.items_, alloc) {}
inline void Array::push_back(const Value &v) { items_.push_back(v); }
inline void Array::push_back(Value &&v) { items_.push_back(std::move(v)); }
inline void Array::reserve(size_t n) { items_.reserve(n); }
inline size_t Array::size() const { return items_.size(); }
inline bool Array::empty() const { return items_.empty(); }
inline Value &Array::operator[](size_t index) { return items_[index]; }
inline const Value &Array::operator[](size_t index) const {
  return items_[index];
}
inline Array::iterator Array::begin() { return items_.begin(); }
inline Array::iterator Array::end() { return items_.end(); }
inline Array::const_iterator Array::begin() const { return items_.begin(); }
inline Array::const_iterator Array::end() const { return items_.end(); }

inline Object::Object(Allocator alloc) : fields_(alloc) {}
inline Object::Object(const Object &other, Allocator alloc)
    : fields_(other.fields_, alloc) {}

inline void Object::insert(String key, Value value) {
  fields_.push_back(Member{std::move(key), std::move(value)});
}

inline bool Object::contains(std::string_view key) const {
  return find(key) != nullptr;
}

inline const Value *Object::find(std::string_view key) const {
  for (auto it = fields_.rbegin(); it != fields_.rend(); ++it) {
    if (it->key == key)
      return &it->value;
  }
  return nullptr;
}

inline Value *Object::find(std::string_view key) {
  return const_cast<Value *>(std::as_const(*this).find(key));
}

inline const Value &Object::operator[](std::string_view key) const {
  const Value *v = find(key);
  if (!v)
    throw TypeError("Key not found: " + std::string(key));
  return *v;
}

inline size_t Object::size() const { return fields_.size(); }
inline bool Object::empty() const { return fields_.empty(); }
inline Object::iterator Object::begin() { return fields_.begin(); }
inline Object::iterator Object::end() { return fields_.end(); }
inline Object::const_iterator Object::begin() const { return fields_.begin(); }
inline Object::const_iterator Object::end() const { return fields_.end(); }

inline const Value &Value::operator[](size_t index) const {
  const Array &arr = as_array();
  if (index >= arr.size())
    throw TypeError("Index out of bounds");
  return arr[index];
}

inline const Value &Value::operator[](std::string_view key) const {
  return as_object()[key];
}

inline bool operator==(const Value &a, const Value &b) {
  if (a.type() != b.type())
    return false;
  switch (a.type()) {
  case ValueType::Null:
    return true;
  case ValueType::Boolean:
    return a.as_bool() == b.as_bool();
  case ValueType::Integer:
    return a.as_int64() == b.as_int64();
  case ValueType::Double:
    return a.as_double() == b.as_double();
  case ValueType::String:
    return a.as_string_view() == b.as_string_view();
  case ValueType::Number:
    return a.as_number() == b.as_number();
  case ValueType::NumberInt:
    return a.as_number_int() == b.as_number_int();
  case ValueType::NumberLong:
    return a.as_number_long() == b.as_number_long();
  case ValueType::NumberDecimal:
    return a.as_decimal128() == b.as_decimal128();
  case ValueType::Array: {
    const Array &x = a.as_array();
    const Array &y = b.as_array();
    if (x.size() != y.size())
      return false;
    for (size_t i = 0; i < x.size(); ++i) {
      if (!(x[i] == y[i]))
        return false;
    }
    return true;
  }
  case ValueType::Object: {
    const Object &x = a.as_object();
    const Object &y = b.as_object();
    if (x.size() != y.size())
      return false;
    auto it = y.begin();
    for (const auto &m : x) {
      if (m.key != it->key || !(m.value == it->value))
        return false;
      ++it;
    }
    return true;
  }
  }
  return false;
}

inline bool operator!=(const Value &a, const Value &b) { return !(a == b); }

} // namespace json
} // namespace ember

#endif // EMBER_JSON_VALUE_HPP
