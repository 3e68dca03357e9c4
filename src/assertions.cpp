#include "vigil/assertions.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>

#include "vigil/diff.hpp"
#include "vigil/jsonpath.hpp"
#include "vigil/log.hpp"
#include "vigil/observability.hpp"

namespace vigil {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

std::string trim_lower(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  std::string out = s.substr(b, e - b + 1);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

Value member(const Object& o, const std::string& key) {
  auto it = o.find(key);
  return it == o.end() ? Value{} : it->second;
}

std::string result_name(const Object& def, size_t index) {
  auto it = def.find("name");
  if (it != def.end() && it->second.is_string() &&
      it->second.as_string().find_first_not_of(" \t\r\n") != std::string::npos) {
    return it->second.as_string();
  }
  return "assertion_" + std::to_string(index);
}

// Python-style str() for substring containment.
std::string display(const Value& v) {
  if (v.is_string()) return v.as_string();
  if (v.is_null()) return "null";
  if (v.is_bool()) return v.as_bool() ? "true" : "false";
  return jsonlite::to_json(v);
}

bool contains(const Value& actual, const Value& expected) {
  if (actual.is_null()) return expected.is_null();
  if (actual.is_string()) return actual.as_string().find(display(expected)) != std::string::npos;
  if (actual.is_array()) {
    for (const auto& item : actual.as_array()) {
      if (jsonlite::values_equal(item, expected)) return true;
    }
    return false;
  }
  return jsonlite::values_equal(actual, expected);
}

// Code points, not bytes.
size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (char c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
  }
  return n;
}

std::optional<double> parse_decimal(const std::string& raw) {
  const auto b = raw.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::nullopt;
  const auto e = raw.find_last_not_of(" \t\r\n");
  const std::string s = raw.substr(b, e - b + 1);
  char* end = nullptr;
  const double d = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(d)) return std::nullopt;
  return d;
}

// Booleans are never numbers here.
std::optional<double> coerce_number(const Value& v) {
  if (v.is_bool()) return std::nullopt;
  if (v.is_number()) return v.as_number();
  if (v.is_string()) return parse_decimal(v.as_string());
  return std::nullopt;
}

std::optional<std::int64_t> coerce_integer(const Value& v) {
  if (v.is_bool()) return std::nullopt;
  if (v.is_int()) return v.as_int();
  auto d = coerce_number(v);
  if (!d || std::floor(*d) != *d) return std::nullopt;
  return static_cast<std::int64_t>(*d);
}

int compare_numbers(double a, double b) {
  const bool integral = std::floor(a) == a && std::floor(b) == b &&
                        std::fabs(a) < 9.0e15 && std::fabs(b) < 9.0e15;
  if (integral) {
    const auto ia = static_cast<std::int64_t>(a);
    const auto ib = static_cast<std::int64_t>(b);
    return ia < ib ? -1 : (ia > ib ? 1 : 0);
  }
  return a < b ? -1 : (a > b ? 1 : 0);
}

AssertionResult make(const Object& def, size_t index, std::string op, bool passed, Value actual,
                     Value expected, std::string failure_message) {
  AssertionResult r;
  r.name = result_name(def, index);
  r.op = std::move(op);
  r.passed = passed;
  r.actual = std::move(actual);
  r.expected = std::move(expected);
  if (!passed) r.message = std::move(failure_message);
  return r;
}

struct OperandPair {
  Value actual;
  Value expected;
};

OperandPair rendered_operands(const Object& def, const ExecutionContext& ctx) {
  return {ctx.render(member(def, "actual")), ctx.render(member(def, "expected"))};
}

struct JsonPathLookup {
  bool ok{false};
  Value actual;
  std::string path;
  std::string error;
};

JsonPathLookup lookup_jsonpath(const Object& def, const ExecutionContext& ctx) {
  JsonPathLookup out;
  const Value path = ctx.render(member(def, "path"));
  if (!path.is_string() || path.as_string().find_first_not_of(" \t\r\n") == std::string::npos) {
    out.error = "JSONPath expression is required";
    return out;
  }
  out.path = path.as_string();
  Value payload = Object{};
  if (ctx.current_response) {
    if (const Value* json = ctx.current_response->find("json"); json && !json->is_null()) payload = *json;
  }
  std::string err;
  auto matches = jsonpath::find_all(out.path, payload, &err);
  if (!err.empty()) {
    out.error = "Invalid jsonpath expression: " + out.path;
    return out;
  }
  out.ok = true;
  out.actual = jsonpath::collapse(std::move(matches));
  return out;
}

AssertionResult op_status_code(const Object& def, const ExecutionContext& ctx, size_t index) {
  Value expected = ctx.render(member(def, "expected"));
  Value actual;
  if (ctx.current_response) {
    if (const Value* s = ctx.current_response->find("status_code")) actual = *s;
  }
  const bool passed = jsonlite::values_equal(actual, expected);
  return make(def, index, "status_code", passed, std::move(actual), std::move(expected),
              "Status code did not match");
}

AssertionResult op_equality(const Object& def, const ExecutionContext& ctx, size_t index, bool negate) {
  auto [actual, expected] = rendered_operands(def, ctx);
  const bool equal = jsonlite::values_equal(actual, expected);
  const bool passed = negate ? !equal : equal;
  return make(def, index, negate ? "not_equals" : "equals", passed, std::move(actual), std::move(expected),
              negate ? "Values are equal" : "Values are not equal");
}

AssertionResult op_contains(const Object& def, const ExecutionContext& ctx, size_t index, bool negate) {
  auto [actual, expected] = rendered_operands(def, ctx);
  const bool found = contains(actual, expected);
  const bool passed = negate ? !found : found;
  return make(def, index, negate ? "not_contains" : "contains", passed, std::move(actual),
              std::move(expected), negate ? "Unexpected value present" : "Expected value not found");
}

AssertionResult op_regex(const Object& def, const ExecutionContext& ctx, size_t index, const std::string& op) {
  auto [actual, pattern] = rendered_operands(def, ctx);
  if (!actual.is_string() || !pattern.is_string()) {
    return make(def, index, op, false, std::move(actual), std::move(pattern),
                "Regex requires string actual and expected values");
  }
  if (actual.as_string().size() > kMaxRegexSubjectBytes) {
    const std::string message = "Regex subject is " + std::to_string(actual.as_string().size()) +
                                " bytes, above the " + std::to_string(kMaxRegexSubjectBytes) + "-byte limit";
    return make(def, index, op, false, std::move(actual), std::move(pattern), message);
  }
  bool matched = false;
  try {
    const std::regex re(pattern.as_string(), std::regex::ECMAScript);
    matched = std::regex_search(actual.as_string(), re);
  } catch (const std::regex_error& e) {
    return make(def, index, op, false, std::move(actual), std::move(pattern),
                std::string("Invalid regex pattern: ") + e.what());
  }
  return make(def, index, op, matched, std::move(actual), std::move(pattern), "Pattern did not match");
}

AssertionResult op_length(const Object& def, const ExecutionContext& ctx, size_t index) {
  auto [actual, expected] = rendered_operands(def, ctx);
  std::optional<size_t> length;
  if (actual.is_string()) length = utf8_length(actual.as_string());
  else if (actual.is_array()) length = actual.as_array().size();
  else if (actual.is_object()) length = actual.as_object().size();
  if (!length) {
    return make(def, index, "length", false, std::move(actual), std::move(expected),
                std::string("Length requires a string, list or object actual value, got ") +
                    jsonlite::type_name(actual));
  }
  auto want = coerce_integer(expected);
  if (!want) {
    return make(def, index, "length", false, std::move(actual), std::move(expected),
                "Expected length must be an integer");
  }
  const bool passed = static_cast<std::int64_t>(*length) == *want;
  return make(def, index, "length", passed, std::move(actual), std::move(expected),
              "Length " + std::to_string(*length) + " does not match expected " + std::to_string(*want));
}

AssertionResult op_compare(const Object& def, const ExecutionContext& ctx, size_t index, bool greater) {
  const std::string op = greater ? "gt" : "lt";
  auto [actual, expected] = rendered_operands(def, ctx);
  if (actual.is_bool() || expected.is_bool()) {
    return make(def, index, op, false, std::move(actual), std::move(expected),
                "Numeric comparison does not accept boolean values");
  }
  auto a = coerce_number(actual);
  auto b = coerce_number(expected);
  if (!a || !b) {
    return make(def, index, op, false, std::move(actual), std::move(expected),
                "Numeric comparison requires numeric actual and expected values");
  }
  const int cmp = compare_numbers(*a, *b);
  const bool passed = greater ? cmp > 0 : cmp < 0;
  return make(def, index, op, passed, std::move(actual), std::move(expected),
              greater ? "Value is not greater than expected" : "Value is not less than expected");
}

AssertionResult op_jsonpath(const Object& def, const ExecutionContext& ctx, size_t index, bool containment) {
  const std::string op = containment ? "jsonpath_contains" : "jsonpath_equals";
  Value expected = ctx.render(member(def, "expected"));
  auto lookup = lookup_jsonpath(def, ctx);
  if (!lookup.ok) {
    auto r = make(def, index, op, false, nullptr, std::move(expected), lookup.error);
    if (!lookup.path.empty()) r.path = lookup.path;
    return r;
  }
  const bool passed = containment ? contains(lookup.actual, expected)
                                  : jsonlite::values_equal(lookup.actual, expected);
  auto r = make(def, index, op, passed, std::move(lookup.actual), std::move(expected),
                containment ? "Expected value not present in JSONPath result"
                            : "JSONPath equality assertion failed");
  r.path = lookup.path;
  return r;
}

AssertionResult dispatch(AssertionOperator op, const std::string& op_name, const Object& def,
                         const ExecutionContext& ctx, size_t index) {
  switch (op) {
    case AssertionOperator::status_code: return op_status_code(def, ctx, index);
    case AssertionOperator::equals: return op_equality(def, ctx, index, false);
    case AssertionOperator::not_equals: return op_equality(def, ctx, index, true);
    case AssertionOperator::contains: return op_contains(def, ctx, index, false);
    case AssertionOperator::not_contains: return op_contains(def, ctx, index, true);
    case AssertionOperator::regex:
    case AssertionOperator::regex_match: return op_regex(def, ctx, index, op_name);
    case AssertionOperator::length: return op_length(def, ctx, index);
    case AssertionOperator::gt: return op_compare(def, ctx, index, true);
    case AssertionOperator::lt: return op_compare(def, ctx, index, false);
    case AssertionOperator::jsonpath_equals: return op_jsonpath(def, ctx, index, false);
    case AssertionOperator::jsonpath_contains: return op_jsonpath(def, ctx, index, true);
  }
  return make(def, index, op_name, false, nullptr, nullptr, "Unsupported assertion operator '" + op_name + "'");
}

void attach_diff(AssertionResult& r) {
  auto entries = diff_json(r.expected, r.actual);
  if (entries.empty()) return;
  Array list;
  list.reserve(entries.size());
  for (const auto& e : entries) list.push_back(e.to_json());
  Object diff;
  diff["entries"] = std::move(list);
  diff["text"] = format_diff(entries).value_or("");
  r.diff = Value{std::move(diff)};
}

}  // namespace

std::string to_string(AssertionOperator op) {
  switch (op) {
    case AssertionOperator::status_code: return "status_code";
    case AssertionOperator::equals: return "equals";
    case AssertionOperator::not_equals: return "not_equals";
    case AssertionOperator::contains: return "contains";
    case AssertionOperator::not_contains: return "not_contains";
    case AssertionOperator::regex: return "regex";
    case AssertionOperator::regex_match: return "regex_match";
    case AssertionOperator::length: return "length";
    case AssertionOperator::gt: return "gt";
    case AssertionOperator::lt: return "lt";
    case AssertionOperator::jsonpath_equals: return "jsonpath_equals";
    case AssertionOperator::jsonpath_contains: return "jsonpath_contains";
  }
  return "unknown";
}

std::optional<AssertionOperator> parse_assertion_operator(const std::string& name) {
  static const AssertionOperator kAll[] = {
      AssertionOperator::status_code,  AssertionOperator::equals,          AssertionOperator::not_equals,
      AssertionOperator::contains,     AssertionOperator::not_contains,    AssertionOperator::regex,
      AssertionOperator::regex_match,  AssertionOperator::length,          AssertionOperator::gt,
      AssertionOperator::lt,           AssertionOperator::jsonpath_equals, AssertionOperator::jsonpath_contains,
  };
  const std::string key = trim_lower(name);
  for (auto op : kAll) {
    if (to_string(op) == key) return op;
  }
  return std::nullopt;
}

Object AssertionResult::to_json() const {
  Object o;
  o["name"] = name;
  o["operator"] = op;
  o["passed"] = passed;
  o["actual"] = actual;
  o["expected"] = expected;
  if (message) o["message"] = *message;
  if (path) o["path"] = *path;
  if (diff) o["diff"] = *diff;
  return o;
}

Object AssertionOutcome::to_json() const {
  Array list;
  list.reserve(results.size());
  for (const auto& r : results) list.push_back(r.to_json());
  Object o;
  o["passed"] = passed;
  o["results"] = std::move(list);
  return o;
}

std::vector<Object> normalize_assertions(const Value& assertions) {
  std::vector<Object> out;
  auto take_objects = [&out](const Array& items) {
    for (const auto& item : items) {
      if (item.is_object()) out.push_back(item.as_object());
    }
  };
  if (assertions.is_array()) {
    take_objects(assertions.as_array());
  } else if (assertions.is_object()) {
    const Object& o = assertions.as_object();
    if (const Value* items = assertions.find("items"); items && items->is_array()) {
      take_objects(items->as_array());
    } else {
      for (const auto& [op, expected] : o) {
        if (op == "items") continue;
        out.push_back(Object{{"operator", op}, {"expected", expected}});
      }
    }
  }
  return out;
}

AssertionResult AssertionEngine::evaluate_one(const Object& def, const ExecutionContext& context,
                                              size_t index) const {
  const Value raw_op = member(def, "operator");
  const std::string op_name = raw_op.is_string() ? trim_lower(raw_op.as_string())
                              : raw_op.is_null() ? std::string{}
                                                 : trim_lower(jsonlite::to_json(raw_op));
  const Value enabled = member(def, "enabled");
  if (enabled.is_bool() && !enabled.as_bool()) {
    auto r = make(def, index, op_name.empty() ? "unknown" : op_name, true, nullptr,
                  context.render(member(def, "expected")), "");
    r.message = "Assertion disabled; skipped";
    return r;
  }
  if (op_name.empty()) {
    return make(def, index, "unknown", false, nullptr, nullptr, "Assertion operator is required");
  }

  auto op = parse_assertion_operator(op_name);
  if (!op) {
    return make(def, index, op_name, false, nullptr, nullptr,
                "Unsupported assertion operator '" + op_name + "'");
  }

  AssertionResult r;
  try {
    r = dispatch(*op, op_name, def, context, index);
  } catch (const std::exception& e) {
    r = make(def, index, op_name, false, nullptr, nullptr, e.what());
  }
  if (!r.passed) {
    const Value custom = member(def, "message");
    if (custom.is_string() && !custom.as_string().empty()) r.message = custom.as_string();
    attach_diff(r);
  }
  return r;
}

AssertionOutcome AssertionEngine::evaluate(const Value& assertions, const Value& response_context,
                                           ExecutionContext& context) const {
  AssertionOutcome out;
  const auto definitions = normalize_assertions(assertions);
  if (definitions.empty()) return out;

  context.set_current_response(response_context);
  out.results.reserve(definitions.size());
  for (size_t i = 0; i < definitions.size(); ++i) {
    out.results.push_back(evaluate_one(definitions[i], context, i));
    if (!out.results.back().passed) out.passed = false;
  }

  auto& stats = global_engine_stats();
  size_t failed = 0;
  for (const auto& r : out.results) failed += r.passed ? 0 : 1;
  stats.assertions_evaluated.fetch_add(out.results.size(), std::memory_order_relaxed);
  stats.assertions_failed.fetch_add(failed, std::memory_order_relaxed);
  log_debug("assertions", "evaluated",
            {{"count", out.results.size()}, {"failed", failed}, {"passed", out.passed}});
  return out;
}

}  // namespace vigil
