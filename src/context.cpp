#include "vigil/context.hpp"

#include <cctype>
#include <cstdlib>

#include "vigil/jsonpath.hpp"
#include "vigil/log.hpp"

namespace vigil {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// jsonpath('<expr>') or jsonpath("<expr>"); returns the inner expression.
std::optional<std::string> jsonpath_call(const std::string& segment) {
  static const std::string kPrefix = "jsonpath(";
  if (segment.size() < kPrefix.size() + 3 || segment.compare(0, kPrefix.size(), kPrefix) != 0 ||
      segment.back() != ')') {
    return std::nullopt;
  }
  const char q = segment[kPrefix.size()];
  const char q_end = segment[segment.size() - 2];
  if ((q != '\'' && q != '"') || q_end != q) return std::nullopt;
  return segment.substr(kPrefix.size() + 1, segment.size() - kPrefix.size() - 3);
}

std::optional<long long> parse_index(const std::string& s) {
  if (s.empty()) return std::nullopt;
  size_t k = (s[0] == '-') ? 1 : 0;
  if (k == s.size()) return std::nullopt;
  for (; k < s.size(); ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k]))) return std::nullopt;
  }
  return std::strtoll(s.c_str(), nullptr, 10);
}

Resolution traverse(const Value* node, const std::vector<std::string>& path, size_t from) {
  if (!node) return {};
  const Value* current = node;
  for (size_t k = from; k < path.size(); ++k) {
    const std::string& segment = path[k];
    if (auto expr = jsonpath_call(segment)) {
      const Value* target = current;
      if (const Value* json = current->find("json")) target = json;
      std::string err;
      Value result = jsonpath::query(*expr, *target, &err);
      if (!err.empty()) {
        log_warn("context", "template_jsonpath_invalid", {{"expression", *expr}, {"error", err}});
        return {};
      }
      return Resolution{true, std::move(result)};
    }
    if (current->is_object()) {
      current = current->find(segment);
      if (!current) return {};
      continue;
    }
    if (current->is_array()) {
      auto idx = parse_index(segment);
      if (!idx) return {};
      const auto& arr = current->as_array();
      long long i = *idx < 0 ? *idx + static_cast<long long>(arr.size()) : *idx;
      if (i < 0 || i >= static_cast<long long>(arr.size())) return {};
      current = &arr[static_cast<size_t>(i)];
      continue;
    }
    return {};
  }
  return Resolution{true, *current};
}

std::string stringify(const Value& v) {
  if (v.is_null()) return "";
  if (v.is_string()) return v.as_string();
  if (v.is_bool()) return v.as_bool() ? "true" : "false";
  return jsonlite::to_json(v);
}

// Scalars are collected in their rendered text form.
void collect_secret_texts(const Value& v, std::vector<std::string>& out) {
  if (v.is_object()) {
    for (const auto& [k, item] : v.as_object()) collect_secret_texts(item, out);
  } else if (v.is_array()) {
    for (const auto& item : v.as_array()) collect_secret_texts(item, out);
  } else if (!v.is_null()) {
    std::string text = stringify(v);
    if (!text.empty()) out.push_back(std::move(text));
  }
}

}  // namespace

std::vector<std::string> split_template_path(const std::string& expr) {
  std::vector<std::string> out;
  std::string cur;
  char quote = 0;
  int parens = 0;
  for (char c : expr) {
    if (quote) {
      cur += c;
      if (c == quote) quote = 0;
      continue;
    }
    if (c == '\'' || c == '"') { quote = c; cur += c; continue; }
    if (c == '(') ++parens;
    if (c == ')' && parens > 0) --parens;
    if (c == '.' && parens == 0) {
      out.push_back(trim(cur));
      cur.clear();
      continue;
    }
    cur += c;
  }
  out.push_back(trim(cur));
  return out;
}

void ExecutionContext::remember_step(const std::string& alias, Value snapshot) {
  step_history[alias] = std::move(snapshot);
}

void ExecutionContext::set_current_response(std::optional<Value> response) {
  current_response = std::move(response);
}

Resolution ExecutionContext::resolve(const std::string& raw) const {
  const std::string expr = trim(raw);
  if (expr.empty()) return {};
  const auto segments = split_template_path(expr);
  const std::string& root = segments[0];

  if (root == "variables") {
    const Value vars{variables};
    return traverse(&vars, segments, 1);
  }
  if (root == "env") {
    const Value env{environment};
    return traverse(&env, segments, 1);
  }
  if (root == "secret") {
    const Value sec{secrets};
    return traverse(&sec, segments, 1);
  }
  if (root == "row") {
    if (!dataset_row) return {};
    const Value row{*dataset_row};
    return traverse(&row, segments, 1);
  }
  if (root == "prev" || root == "steps") {
    if (segments.size() < 2) return {};
    auto it = step_history.find(segments[1]);
    if (it == step_history.end()) return {};
    return traverse(&it->second, segments, 2);
  }
  if (root == "response") {
    if (!current_response) return {};
    return traverse(&*current_response, segments, 1);
  }
  const Value vars{variables};
  return traverse(&vars, segments, 0);
}

Value ExecutionContext::render(const Value& value) const {
  if (value.is_object()) {
    Object out;
    for (const auto& [k, v] : value.as_object()) out[k] = render(v);
    return out;
  }
  if (value.is_array()) {
    Array out;
    out.reserve(value.as_array().size());
    for (const auto& v : value.as_array()) out.push_back(render(v));
    return out;
  }
  if (!value.is_string()) return value;

  const std::string& tpl = value.as_string();
  if (tpl.find("{{") == std::string::npos || tpl.find("}}") == std::string::npos) return value;

  // Whole-string placeholder keeps the resolved type.
  const std::string& t = tpl;
  if (t.size() >= 4 && t.compare(0, 2, "{{") == 0 && t.compare(t.size() - 2, 2, "}}") == 0 &&
      t.find("{{", 2) == std::string::npos && t.find("}}") == t.size() - 2) {
    auto r = resolve(t.substr(2, t.size() - 4));
    return r.found ? r.value : value;
  }

  std::string out;
  out.reserve(tpl.size());
  size_t pos = 0;
  while (pos < tpl.size()) {
    const size_t open = tpl.find("{{", pos);
    if (open == std::string::npos) break;
    const size_t close = tpl.find("}}", open + 2);
    if (close == std::string::npos) break;
    out.append(tpl, pos, open - pos);
    const std::string inner = tpl.substr(open + 2, close - open - 2);
    auto r = inner.find_first_of("{}") == std::string::npos ? resolve(inner) : Resolution{};
    if (r.found) {
      out += stringify(r.value);
    } else {
      out.append(tpl, open, close + 2 - open);
    }
    pos = close + 2;
  }
  out.append(tpl, pos, std::string::npos);
  return out;
}

std::vector<std::string> ExecutionContext::secret_values() const {
  std::vector<std::string> out;
  collect_secret_texts(Value{secrets}, out);
  return out;
}

Object merge_inputs(const Object& base, const Object& overrides) {
  Object out = base;
  for (const auto& [k, v] : overrides) {
    auto it = out.find(k);
    if (it != out.end() && it->second.is_object() && v.is_object()) {
      for (const auto& [nk, nv] : v.as_object()) it->second.as_object()[nk] = nv;
    } else {
      out[k] = v;
    }
  }
  return out;
}

}  // namespace vigil
