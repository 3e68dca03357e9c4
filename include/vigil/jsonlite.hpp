#pragma once

// vigil/jsonlite.hpp — Minimal JSON value model used for every dynamic payload
// in the engine: case variables, request/response payloads, assertion operands,
// policy documents and progress event payloads.
//
// DETERMINISM:
//   - Object is a std::map, so to_json() always emits keys in sorted order.
//   - format_double() uses "%.6f" with trailing-zero trimming (locale-free).
//   - Integers stay integral (int64). Only literals with a fraction or an
//     exponent, or integers outside the int64 range, become doubles.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace vigil::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(long i) : v(static_cast<std::int64_t>(i)) {}
  Value(long long i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned int i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned long i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned long long i) : v(static_cast<std::int64_t>(i)) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_int() const { return std::holds_alternative<std::int64_t>(v); }
  bool is_double() const { return std::holds_alternative<double>(v); }
  bool is_number() const { return is_int() || is_double(); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }

  bool as_bool() const { return std::get<bool>(v); }
  std::int64_t as_int() const { return std::get<std::int64_t>(v); }
  double as_number() const {
    return is_int() ? static_cast<double>(std::get<std::int64_t>(v)) : std::get<double>(v);
  }
  const std::string& as_string() const { return std::get<std::string>(v); }
  const Object& as_object() const { return std::get<Object>(v); }
  Object& as_object() { return std::get<Object>(v); }
  const Array& as_array() const { return std::get<Array>(v); }
  Array& as_array() { return std::get<Array>(v); }

  // Object member lookup; nullptr when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Strict parse of a full document. Trailing data, duplicate keys and NaN/Infinity
// are errors. On error returns null and fills *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document that must be an object. Returns {} on error or non-object.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Compact JSON with sorted keys.
std::string to_json(const Value& v);

// Indented JSON for human-facing CLI output.
std::string to_pretty_json(const Value& v, int indent = 2);

std::string escape(const std::string& s);
std::string format_double(double d);

// Structural equality. Numbers compare by value across int/double; a bool
// never equals a number.
bool values_equal(const Value& a, const Value& b);

// Short type name used in diagnostics: "null", "bool", "int", "float",
// "string", "object", "array".
const char* type_name(const Value& v);

// Type-safe extractors. Each returns the default when the key is absent or
// carries another type.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

}  // namespace vigil::jsonlite
