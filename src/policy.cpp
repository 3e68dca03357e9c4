#include "vigil/policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iterator>

#include "vigil/hash.hpp"

namespace vigil {

namespace {

// Numbers and numeric strings coerce; anything else yields the fallback.
double coerce_double(const jsonlite::Value* v, double fallback) {
  if (!v || v->is_null()) return fallback;
  if (v->is_number()) return v->as_number();
  if (v->is_string()) {
    const auto& s = v->as_string();
    if (s.find_first_not_of(" \t") == std::string::npos) return fallback;
    char* end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (end && *end == '\0' && std::isfinite(d)) return d;
  }
  return fallback;
}

std::int64_t coerce_int(const jsonlite::Value* v, std::int64_t fallback) {
  if (!v || v->is_null()) return fallback;
  if (v->is_int()) return v->as_int();
  if (v->is_double()) return static_cast<std::int64_t>(v->as_number());
  if (v->is_string()) {
    char* end = nullptr;
    const long long n = std::strtoll(v->as_string().c_str(), &end, 10);
    if (end && *end == '\0' && !v->as_string().empty()) return n;
  }
  return fallback;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::set<std::string> tag_set(const jsonlite::Object& doc, const std::string& key) {
  std::set<std::string> out;
  for (auto& t : jsonlite::get_string_array(doc, key)) {
    if (!t.empty()) out.insert(std::move(t));
  }
  return out;
}

const jsonlite::Value* member(const jsonlite::Object& doc, const char* key) {
  auto it = doc.find(key);
  return it == doc.end() ? nullptr : &it->second;
}

RetryBackoff resolve_backoff(const jsonlite::Object& raw) {
  RetryBackoff b;
  auto at = [&](const char* k) { return member(raw, k); };
  if (auto s = parse_backoff_strategy(jsonlite::get_string(raw, "strategy", ""))) b.strategy = *s;
  b.base_seconds = std::max(0.1, coerce_double(at("base_seconds"), b.base_seconds));
  b.max_seconds = std::max(b.base_seconds, coerce_double(at("max_seconds"), b.max_seconds));
  b.jitter_ratio = std::clamp(coerce_double(at("jitter_ratio"), b.jitter_ratio), 0.0, 1.0);
  b.retry_on_assertions = jsonlite::get_bool(raw, "retry_on_assertions", b.retry_on_assertions);
  b.cooldown_seconds = std::max(1.0, coerce_double(at("cooldown_seconds"), b.cooldown_seconds));
  return b;
}

}  // namespace

std::string to_string(BackoffStrategy s) {
  switch (s) {
    case BackoffStrategy::exponential: return "exponential";
    case BackoffStrategy::exponential_jitter: return "exponential_jitter";
    case BackoffStrategy::full_jitter: return "full_jitter";
  }
  return "exponential_jitter";
}

std::optional<BackoffStrategy> parse_backoff_strategy(const std::string& s) {
  if (s == "exponential") return BackoffStrategy::exponential;
  if (s == "exponential_jitter") return BackoffStrategy::exponential_jitter;
  if (s == "full_jitter") return BackoffStrategy::full_jitter;
  return std::nullopt;
}

std::string PolicySnapshot::key() const {
  if (id && !id->empty()) return *id;
  return "default:" + lower(name);
}

jsonlite::Object PolicySnapshot::to_json() const {
  jsonlite::Object backoff;
  backoff["strategy"] = to_string(retry_backoff.strategy);
  backoff["base_seconds"] = retry_backoff.base_seconds;
  backoff["max_seconds"] = retry_backoff.max_seconds;
  backoff["jitter_ratio"] = retry_backoff.jitter_ratio;
  backoff["retry_on_assertions"] = retry_backoff.retry_on_assertions;
  backoff["cooldown_seconds"] = retry_backoff.cooldown_seconds;

  jsonlite::Array inc, exc;
  for (const auto& t : tags_include) inc.push_back(t);
  for (const auto& t : tags_exclude) exc.push_back(t);

  jsonlite::Object o;
  o["id"] = id ? jsonlite::Value{*id} : jsonlite::Value{};
  o["name"] = name;
  o["max_concurrency"] = max_concurrency ? jsonlite::Value{*max_concurrency} : jsonlite::Value{};
  o["per_host_qps"] = per_host_qps ? jsonlite::Value{*per_host_qps} : jsonlite::Value{};
  o["priority"] = priority;
  o["retry_max_attempts"] = retry_max_attempts;
  o["retry_backoff"] = backoff;
  o["timeout_seconds"] = timeout_seconds;
  o["circuit_breaker_threshold"] = circuit_breaker_threshold;
  o["circuit_breaker_window_seconds"] = circuit_breaker_window_seconds;
  o["tags_include"] = inc;
  o["tags_exclude"] = exc;
  o["enabled"] = enabled;
  return o;
}

std::string PolicySnapshot::digest() const {
  return policy_digest(jsonlite::to_json(to_json()));
}

bool PolicySnapshot::selects(const std::vector<std::string>& tags) const {
  for (const auto& t : tags) {
    if (tags_exclude.contains(t)) return false;
  }
  if (tags_include.empty()) return true;
  return std::any_of(tags.begin(), tags.end(),
                     [&](const std::string& t) { return tags_include.contains(t); });
}

PolicySnapshot PolicySnapshot::from_json(const jsonlite::Object& doc) {
  PolicySnapshot p;
  if (auto v = member(doc, "id"); v && v->is_string() && !v->as_string().empty()) {
    p.id = v->as_string();
  } else if (v && v->is_int()) {
    p.id = std::to_string(v->as_int());
  }
  const std::string name = jsonlite::get_string(doc, "name", "");
  p.name = name.empty() ? "default" : name;

  if (auto v = member(doc, "max_concurrency"); v && !v->is_null()) {
    const std::int64_t n = coerce_int(v, 0);
    if (n > 0) p.max_concurrency = static_cast<std::uint32_t>(n);
  }
  if (auto v = member(doc, "per_host_qps"); v && !v->is_null()) {
    const double q = coerce_double(v, 0.0);
    if (q > 0.0) p.per_host_qps = q;
  }
  p.priority = static_cast<std::uint32_t>(
      std::clamp<std::int64_t>(coerce_int(member(doc, "priority"), 5), 0, kMaxPriority));
  p.retry_max_attempts = static_cast<std::uint32_t>(
      std::clamp<std::int64_t>(coerce_int(member(doc, "retry_max_attempts"), 3), 1, kMaxAttempts));
  p.retry_backoff = resolve_backoff(jsonlite::get_object(doc, "retry_backoff"));
  p.timeout_seconds = std::max(1.0, coerce_double(member(doc, "timeout_seconds"), 30.0));
  p.circuit_breaker_threshold = static_cast<std::uint32_t>(
      std::max<std::int64_t>(1, coerce_int(member(doc, "circuit_breaker_threshold"), 5)));
  p.circuit_breaker_window_seconds = static_cast<std::uint32_t>(
      std::max<std::int64_t>(1, coerce_int(member(doc, "circuit_breaker_window_seconds"), 60)));
  p.tags_exclude = tag_set(doc, "tags_exclude");
  for (auto& t : tag_set(doc, "tags_include")) {
    if (!p.tags_exclude.contains(t)) p.tags_include.insert(t);
  }
  p.enabled = jsonlite::get_bool(doc, "enabled", true);
  return p;
}

PolicySnapshot PolicySnapshot::from_json_strict(const jsonlite::Object& doc) {
  auto v = validate_policy(doc);
  if (!v.ok) {
    std::string what = "invalid policy: " + v.errors.front();
    if (v.errors.size() > 1) what += " (+" + std::to_string(v.errors.size() - 1) + " more)";
    throw PolicyError(what, v.errors);
  }
  return from_json(doc);
}

PolicySnapshot default_policy_snapshot(double timeout_seconds) {
  PolicySnapshot p;
  p.timeout_seconds = std::max(1.0, timeout_seconds);
  return p;
}

PolicyValidation validate_policy(const jsonlite::Object& doc) {
  PolicyValidation r;
  auto err = [&](std::string m) { r.errors.push_back(std::move(m)); };

  auto check_int = [&](const char* key, std::int64_t lo, std::int64_t hi) {
    const jsonlite::Value* v = member(doc, key);
    if (!v || v->is_null()) return;
    if (!v->is_int()) { err(std::string(key) + " must be an integer"); return; }
    if (v->as_int() < lo || v->as_int() > hi) {
      err(std::string(key) + " must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
  };
  auto check_num = [&](const jsonlite::Object& o, const std::string& prefix, const char* key,
                       double lo, double hi) {
    auto it = o.find(key);
    if (it == o.end() || it->second.is_null()) return;
    if (!it->second.is_number()) { err(prefix + key + " must be a number"); return; }
    const double d = it->second.as_number();
    if (d < lo || d > hi) {
      err(prefix + key + " must be in [" + jsonlite::format_double(lo) + ", " +
          jsonlite::format_double(hi) + "]");
    }
  };

  if (auto v = member(doc, "name"); v && !v->is_string()) err("name must be a string");
  if (auto v = member(doc, "id"); v && !v->is_null() && !v->is_string()) err("id must be a string");
  check_int("max_concurrency", 0, 1 << 20);
  check_num(doc, "", "per_host_qps", 0.0, 1e9);
  check_int("priority", 0, PolicySnapshot::kMaxPriority);
  check_int("retry_max_attempts", 1, PolicySnapshot::kMaxAttempts);
  check_num(doc, "", "timeout_seconds", 1.0, 86400.0);
  check_int("circuit_breaker_threshold", 1, 1 << 20);
  check_int("circuit_breaker_window_seconds", 1, 86400 * 7);
  if (auto v = member(doc, "enabled"); v && !v->is_bool()) err("enabled must be a boolean");

  if (auto v = member(doc, "retry_backoff"); v && !v->is_null()) {
    if (!v->is_object()) {
      err("retry_backoff must be an object");
    } else {
      const auto& b = v->as_object();
      const std::string strategy = jsonlite::get_string(b, "strategy", "");
      if (b.contains("strategy") && !parse_backoff_strategy(strategy)) {
        err("retry_backoff.strategy must be one of exponential, exponential_jitter, full_jitter");
      }
      check_num(b, "retry_backoff.", "base_seconds", 0.1, 3600.0);
      check_num(b, "retry_backoff.", "max_seconds", 0.1, 86400.0);
      check_num(b, "retry_backoff.", "jitter_ratio", 0.0, 1.0);
      check_num(b, "retry_backoff.", "cooldown_seconds", 1.0, 86400.0);
      const double base = jsonlite::get_double(b, "base_seconds", 1.5);
      const double max = jsonlite::get_double(b, "max_seconds", 30.0);
      if (max < base) err("retry_backoff.max_seconds must be >= base_seconds");
      if (auto it = b.find("retry_on_assertions"); it != b.end() && !it->second.is_bool()) {
        err("retry_backoff.retry_on_assertions must be a boolean");
      }
    }
  }

  for (const char* key : {"tags_include", "tags_exclude"}) {
    auto v = member(doc, key);
    if (!v || v->is_null()) continue;
    bool ok = v->is_array();
    if (ok) {
      for (const auto& t : v->as_array()) ok = ok && t.is_string();
    }
    if (!ok) err(std::string(key) + " must be an array of strings");
  }
  const auto inc = tag_set(doc, "tags_include");
  const auto exc = tag_set(doc, "tags_exclude");
  std::vector<std::string> overlap;
  std::set_intersection(inc.begin(), inc.end(), exc.begin(), exc.end(), std::back_inserter(overlap));
  if (!overlap.empty()) {
    std::string joined;
    for (const auto& t : overlap) joined += (joined.empty() ? "" : ", ") + t;
    err("tags_include and tags_exclude must be disjoint (overlap: " + joined + ")");
  }

  r.ok = r.errors.empty();
  return r;
}

}  // namespace vigil
