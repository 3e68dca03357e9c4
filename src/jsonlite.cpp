#include "vigil/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - to_json() emits sorted keys (std::map iteration).
//   - format_double() always uses 6 decimal places with trailing-zero trimming.
//
// DETERMINISM RISKS:
//   - std::strtod() is locale-sensitive. It is used only for input parsing, not
//     for canonical output. Output uses format_double().

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <sstream>

namespace vigil::jsonlite {

namespace {

void append_utf8(std::string& o, std::uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  int depth{0};

  static constexpr int kMaxDepth = 256;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') {
          std::uint32_t cp = 0;
          if (!read_hex4(cp)) { err = JsonError{"json_parse_error", "invalid unicode escape"}; return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            std::uint32_t lo = 0;
            if (!read_hex4(lo)) { err = JsonError{"json_parse_error", "invalid unicode escape"}; return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
        }
        else o += n;
      } else {
        o += c;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      has_exp = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    if (!has_frac && !has_exp) {
      errno = 0;
      char* end = nullptr;
      const long long n = std::strtoll(num_str.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0') {
        out_val = Value{static_cast<std::int64_t>(n)};
        return true;
      }
      // Out of int64 range: fall through to double.
    }
    char* end = nullptr;
    const double d = std::strtod(num_str.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(d)) {
      err = JsonError{"json_parse_error", "invalid number"};
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { err = JsonError{"json_parse_error", "nesting too deep"}; return {}; }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    if (!err) err = JsonError{"json_parse_error", "unexpected token at offset " + std::to_string(i)};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }
};

// Fast path for strings with no escape characters (the common case).
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else                 o += c;
  }
  return o;
}

void write_pretty(std::ostringstream& oss, const Value& v, int indent, int level) {
  const std::string pad(static_cast<size_t>(indent * (level + 1)), ' ');
  const std::string close_pad(static_cast<size_t>(indent * level), ' ');
  if (v.is_object() && !v.as_object().empty()) {
    oss << "{\n";
    bool first = true;
    for (const auto& [k, vv] : v.as_object()) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad << "\"" << escape_inner(k) << "\": ";
      write_pretty(oss, vv, indent, level + 1);
    }
    oss << "\n" << close_pad << "}";
    return;
  }
  if (v.is_array() && !v.as_array().empty()) {
    oss << "[\n";
    bool first = true;
    for (const auto& vv : v.as_array()) {
      if (!first) oss << ",\n";
      first = false;
      oss << pad;
      write_pretty(oss, vv, indent, level + 1);
    }
    oss << "\n" << close_pad << "]";
    return;
  }
  oss << to_json(v);
}

Value parse_document(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

}  // namespace

const Value* Value::find(const std::string& key) const {
  if (!is_object()) return nullptr;
  const auto& obj = std::get<Object>(v);
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string format_double(double d) {
  if (!std::isfinite(d)) return "null";
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    n = std::snprintf(buf, sizeof(buf), "%.17g", d);
    return n > 0 ? std::string(buf, static_cast<size_t>(n)) : "0.0";
  }
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

std::string to_json(const Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return v.as_bool() ? "true" : "false";
  if (v.is_string()) return "\"" + escape_inner(v.as_string()) + "\"";
  if (v.is_int()) return std::to_string(v.as_int());
  if (v.is_double()) return format_double(std::get<double>(v.v));
  if (v.is_object()) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : v.as_object()) { if (!first) oss << ","; first = false; oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : v.as_array()) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::string to_pretty_json(const Value& v, int indent) {
  std::ostringstream oss;
  write_pretty(oss, v, indent, 0);
  return oss.str();
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  return parse_document(text, error);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  auto v = parse_document(text, &err);
  if (!err && !v.is_object()) err = JsonError{"json_parse_error", "expected a JSON object"};
  if (error) *error = err;
  if (err) return {};
  return v.as_object();
}

bool values_equal(const Value& a, const Value& b) {
  if (a.is_number() && b.is_number()) {
    if (a.is_int() && b.is_int()) return a.as_int() == b.as_int();
    return a.as_number() == b.as_number();
  }
  if (a.v.index() != b.v.index()) return false;
  if (a.is_null()) return true;
  if (a.is_bool()) return a.as_bool() == b.as_bool();
  if (a.is_string()) return a.as_string() == b.as_string();
  if (a.is_object()) {
    const auto& ao = a.as_object();
    const auto& bo = b.as_object();
    if (ao.size() != bo.size()) return false;
    auto ai = ao.begin();
    auto bi = bo.begin();
    for (; ai != ao.end(); ++ai, ++bi) {
      if (ai->first != bi->first || !values_equal(ai->second, bi->second)) return false;
    }
    return true;
  }
  const auto& aa = a.as_array();
  const auto& ba = b.as_array();
  if (aa.size() != ba.size()) return false;
  for (size_t k = 0; k < aa.size(); ++k) {
    if (!values_equal(aa[k], ba[k])) return false;
  }
  return true;
}

const char* type_name(const Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return "bool";
  if (v.is_int()) return "int";
  if (v.is_double()) return "float";
  if (v.is_string()) return "string";
  if (v.is_object()) return "object";
  return "array";
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_string()) return def;
  return it->second.as_string();
}
bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_bool()) return def;
  return it->second.as_bool();
}
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_int() || it->second.as_int() < 0) return def;
  return static_cast<unsigned long long>(it->second.as_int());
}
double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_number()) return def;
  return it->second.as_number();
}
std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_array()) return out;
  for (const auto& item : it->second.as_array()) {
    if (item.is_string()) out.push_back(item.as_string());
  }
  return out;
}
Object get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_object()) return {};
  return it->second.as_object();
}
Array get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_array()) return {};
  return it->second.as_array();
}

std::string escape(const std::string& s) { return escape_inner(s); }

}  // namespace vigil::jsonlite
