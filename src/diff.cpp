#include "vigil/diff.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace vigil {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

constexpr size_t kValueLimit = 160;

bool is_identifier(const std::string& key) {
  if (key.empty()) return false;
  const auto first = static_cast<unsigned char>(key[0]);
  if (!(std::isalpha(first) || key[0] == '_')) return false;
  for (char c : key) {
    const auto u = static_cast<unsigned char>(c);
    if (!(std::isalnum(u) || c == '_')) return false;
  }
  return true;
}

std::string index_path(const std::string& base, size_t i) {
  return base + "[" + std::to_string(i) + "]";
}

class Differ {
 public:
  Differ(DiffLimits limits, std::vector<DiffEntry>& out) : limits_(limits), out_(out) {}

  void walk(const Value& expected, const Value& actual, const std::string& path, size_t depth) {
    if (full()) return;
    if (depth >= limits_.max_depth) {
      if (!jsonlite::values_equal(expected, actual)) add(path, DiffChange::changed, expected, actual);
      return;
    }
    const bool both_numbers = expected.is_number() && actual.is_number();
    if (!both_numbers && expected.v.index() != actual.v.index()) {
      add(path, DiffChange::type, expected, actual);
      return;
    }
    if (expected.is_object()) {
      walk_object(expected.as_object(), actual.as_object(), path, depth);
      return;
    }
    if (expected.is_array()) {
      walk_array(expected.as_array(), actual.as_array(), path, depth);
      return;
    }
    if (!jsonlite::values_equal(expected, actual)) add(path, DiffChange::changed, expected, actual);
  }

 private:
  bool full() const { return out_.size() >= limits_.max_entries; }

  void add(const std::string& path, DiffChange change, const Value& expected, const Value& actual) {
    out_.push_back(DiffEntry{path, change, expected, actual});
  }

  // Removed keys first, then added keys, then shared keys; each group sorted.
  void walk_object(const Object& expected, const Object& actual, const std::string& path, size_t depth) {
    for (const auto& [key, value] : expected) {
      if (actual.contains(key)) continue;
      add(extend_diff_path(path, key), DiffChange::removed, value, nullptr);
      if (full()) return;
    }
    for (const auto& [key, value] : actual) {
      if (expected.contains(key)) continue;
      add(extend_diff_path(path, key), DiffChange::added, nullptr, value);
      if (full()) return;
    }
    for (const auto& [key, value] : expected) {
      auto it = actual.find(key);
      if (it == actual.end()) continue;
      walk(value, it->second, extend_diff_path(path, key), depth + 1);
      if (full()) return;
    }
  }

  void walk_array(const Array& expected, const Array& actual, const std::string& path, size_t depth) {
    const size_t common = std::min(expected.size(), actual.size());
    for (size_t i = 0; i < common; ++i) {
      walk(expected[i], actual[i], index_path(path, i), depth + 1);
      if (full()) return;
    }
    for (size_t i = common; i < expected.size(); ++i) {
      add(index_path(path, i), DiffChange::removed, expected[i], nullptr);
      if (full()) return;
    }
    for (size_t i = common; i < actual.size(); ++i) {
      add(index_path(path, i), DiffChange::added, nullptr, actual[i]);
      if (full()) return;
    }
  }

  DiffLimits limits_;
  std::vector<DiffEntry>& out_;
};

std::string stringify(const Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return v.as_bool() ? "true" : "false";
  if (v.is_string()) {
    const std::string& s = v.as_string();
    if (s.find('\n') != std::string::npos || s.size() > kValueLimit) return jsonlite::to_json(v);
    return s;
  }
  return jsonlite::to_json(v);
}

std::string format_value(const Value& v) {
  std::string s = stringify(v);
  if (s.size() <= kValueLimit) return s;
  s.resize(kValueLimit - 3);
  return s + "...";
}

std::string_view describe_type(const Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return "boolean";
  if (v.is_number()) return "number";
  if (v.is_string()) return "string";
  if (v.is_array()) return "array";
  return "object";
}

}  // namespace

std::string to_string(DiffChange change) {
  switch (change) {
    case DiffChange::added: return "added";
    case DiffChange::removed: return "removed";
    case DiffChange::changed: return "changed";
    case DiffChange::type: return "type";
  }
  return "changed";
}

Object DiffEntry::to_json() const {
  Object o;
  o["path"] = path;
  o["change"] = to_string(change);
  o["expected"] = expected;
  o["actual"] = actual;
  return o;
}

std::string extend_diff_path(const std::string& base, const std::string& key) {
  if (key.empty()) return base + "[\"\"]";
  if (is_identifier(key)) return base + "." + key;
  std::string escaped;
  escaped.reserve(key.size());
  for (char c : key) {
    if (c == '\'') escaped += '\\';
    escaped += c;
  }
  return base + "['" + escaped + "']";
}

std::vector<DiffEntry> diff_json(const Value& expected, const Value& actual, DiffLimits limits) {
  std::vector<DiffEntry> out;
  Differ(limits, out).walk(expected, actual, "$", 0);
  return out;
}

std::optional<std::string> format_diff(const std::vector<DiffEntry>& entries, size_t max_characters) {
  if (entries.empty()) return std::nullopt;
  std::string text;
  for (const auto& e : entries) {
    if (!text.empty()) text += '\n';
    text += "@@ " + e.path + "\n";
    switch (e.change) {
      case DiffChange::added:
        text += "+ " + format_value(e.actual);
        break;
      case DiffChange::removed:
        text += "- " + format_value(e.expected);
        break;
      case DiffChange::type:
        text += "- type: ";
        text += describe_type(e.expected);
        text += "\n+ type: ";
        text += describe_type(e.actual);
        break;
      case DiffChange::changed:
        text += "- expected: " + format_value(e.expected) + "\n";
        text += "+ actual: " + format_value(e.actual);
        break;
    }
  }
  if (text.size() > max_characters) {
    text.resize(max_characters);
    text += "\n... diff truncated";
  }
  return text;
}

}  // namespace vigil
