#include "vigil/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace vigil {

namespace {

const char* kKnownKeys[] = {
    "config_version", "request_timeout_seconds", "max_response_size_bytes",
    "transport_retry_attempts", "transport_backoff_factor", "transport_max_backoff_seconds",
    "retry_statuses", "retry_methods", "redact_fields", "redaction_placeholder",
    "progress_log", "max_event_bytes", "follow_redirects", "verify_tls",
};

bool is_known_key(const std::string& key) {
  return std::any_of(std::begin(kKnownKeys), std::end(kKnownKeys),
                     [&](const char* k) { return key == k; });
}

std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  std::istringstream iss(s);
  while (std::getline(iss, cur, ',')) {
    cur.erase(0, cur.find_first_not_of(" \t"));
    cur.erase(cur.find_last_not_of(" \t") + 1);
    if (!cur.empty()) out.push_back(cur);
  }
  return out;
}

const char* env(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? e : nullptr;
}

bool parse_env_double(const char* name, double& out) {
  const char* e = env(name);
  if (!e) return false;
  char* end = nullptr;
  const double d = std::strtod(e, &end);
  if (!end || *end != '\0') return false;
  out = d;
  return true;
}

bool parse_env_u64(const char* name, std::uint64_t& out) {
  const char* e = env(name);
  if (!e) return false;
  char* end = nullptr;
  const unsigned long long n = std::strtoull(e, &end, 10);
  if (!end || *end != '\0') return false;
  out = n;
  return true;
}

}  // namespace

EngineConfig EngineConfig::from_json(const jsonlite::Object& doc, EngineConfig base) {
  using namespace jsonlite;
  EngineConfig c = std::move(base);
  c.request_timeout_seconds = get_double(doc, "request_timeout_seconds", c.request_timeout_seconds);
  c.max_response_size_bytes = get_u64(doc, "max_response_size_bytes", c.max_response_size_bytes);
  c.transport_retry_attempts = static_cast<std::uint32_t>(
      get_u64(doc, "transport_retry_attempts", c.transport_retry_attempts));
  c.transport_backoff_factor = get_double(doc, "transport_backoff_factor", c.transport_backoff_factor);
  c.transport_max_backoff_seconds =
      get_double(doc, "transport_max_backoff_seconds", c.transport_max_backoff_seconds);
  if (auto it = doc.find("retry_statuses"); it != doc.end() && it->second.is_array()) {
    c.retry_statuses.clear();
    for (const auto& item : it->second.as_array()) {
      if (item.is_int()) c.retry_statuses.insert(static_cast<int>(item.as_int()));
    }
  }
  if (doc.contains("retry_methods")) {
    c.retry_methods.clear();
    for (const auto& m : get_string_array(doc, "retry_methods")) c.retry_methods.insert(upper(m));
  }
  if (doc.contains("redact_fields")) c.redact_fields = get_string_array(doc, "redact_fields");
  c.redaction_placeholder = get_string(doc, "redaction_placeholder", c.redaction_placeholder);
  if (c.redaction_placeholder.empty()) c.redaction_placeholder = "***";
  c.progress_log = get_string(doc, "progress_log", c.progress_log);
  c.max_event_bytes = get_u64(doc, "max_event_bytes", c.max_event_bytes);
  c.follow_redirects = get_bool(doc, "follow_redirects", c.follow_redirects);
  c.verify_tls = get_bool(doc, "verify_tls", c.verify_tls);
  return c;
}

EngineConfig EngineConfig::from_env(EngineConfig base) {
  EngineConfig c = std::move(base);
  parse_env_double("VIGIL_REQUEST_TIMEOUT_SECONDS", c.request_timeout_seconds);
  parse_env_u64("VIGIL_MAX_RESPONSE_SIZE_BYTES", c.max_response_size_bytes);
  std::uint64_t attempts = c.transport_retry_attempts;
  if (parse_env_u64("VIGIL_TRANSPORT_RETRY_ATTEMPTS", attempts)) {
    c.transport_retry_attempts = static_cast<std::uint32_t>(attempts);
  }
  parse_env_double("VIGIL_TRANSPORT_BACKOFF_FACTOR", c.transport_backoff_factor);
  if (const char* e = env("VIGIL_REDACT_FIELDS")) c.redact_fields = split_csv(e);
  if (const char* e = env("VIGIL_REDACTION_PLACEHOLDER")) c.redaction_placeholder = e;
  if (const char* e = env("VIGIL_PROGRESS_LOG")) c.progress_log = e;
  parse_env_u64("VIGIL_MAX_EVENT_BYTES", c.max_event_bytes);
  if (const char* e = env("VIGIL_VERIFY_TLS")) c.verify_tls = std::string(e) != "0";
  return c;
}

jsonlite::Object EngineConfig::to_json() const {
  jsonlite::Object o;
  o["config_version"] = CONFIG_VERSION;
  o["request_timeout_seconds"] = request_timeout_seconds;
  o["max_response_size_bytes"] = max_response_size_bytes;
  o["transport_retry_attempts"] = transport_retry_attempts;
  o["transport_backoff_factor"] = transport_backoff_factor;
  o["transport_max_backoff_seconds"] = transport_max_backoff_seconds;
  jsonlite::Array statuses;
  for (int s : retry_statuses) statuses.push_back(s);
  o["retry_statuses"] = statuses;
  jsonlite::Array methods;
  for (const auto& m : retry_methods) methods.push_back(m);
  o["retry_methods"] = methods;
  jsonlite::Array fields;
  for (const auto& f : redact_fields) fields.push_back(f);
  o["redact_fields"] = fields;
  o["redaction_placeholder"] = redaction_placeholder;
  o["progress_log"] = progress_log;
  o["max_event_bytes"] = max_event_bytes;
  o["follow_redirects"] = follow_redirects;
  o["verify_tls"] = verify_tls;
  return o;
}

ConfigValidationResult validate_config(const std::string& json_text) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  auto doc = jsonlite::parse(json_text, &err);
  if (err) {
    r.ok = false;
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  for (const auto& [k, v] : doc) {
    if (!is_known_key(k)) r.warnings.push_back("unknown key: " + k);
  }

  auto require_number = [&](const char* key, double min_value) {
    auto it = doc.find(key);
    if (it == doc.end()) return;
    if (!it->second.is_number() || it->second.is_bool()) {
      r.errors.push_back(std::string(key) + " must be a number");
    } else if (it->second.as_number() < min_value) {
      r.errors.push_back(std::string(key) + " must be >= " + jsonlite::format_double(min_value));
    }
  };
  auto require_int = [&](const char* key, std::int64_t min_value) {
    auto it = doc.find(key);
    if (it == doc.end()) return;
    if (!it->second.is_int()) {
      r.errors.push_back(std::string(key) + " must be an integer");
    } else if (it->second.as_int() < min_value) {
      r.errors.push_back(std::string(key) + " must be >= " + std::to_string(min_value));
    }
  };
  auto require_type = [&](const char* key, bool (jsonlite::Value::*pred)() const, const char* type) {
    auto it = doc.find(key);
    if (it == doc.end()) return;
    if (!(it->second.*pred)()) r.errors.push_back(std::string(key) + " must be " + type);
  };

  if (auto it = doc.find("config_version"); it != doc.end()) {
    if (!it->second.is_int()) {
      r.errors.push_back("config_version must be an integer");
    } else if (it->second.as_int() > static_cast<std::int64_t>(CONFIG_VERSION)) {
      r.errors.push_back("config_version " + std::to_string(it->second.as_int()) +
                         " is newer than supported version " + std::to_string(CONFIG_VERSION));
    }
  }
  require_number("request_timeout_seconds", 0.001);
  require_int("max_response_size_bytes", 1);
  require_int("transport_retry_attempts", 1);
  require_number("transport_backoff_factor", 0.0);
  require_number("transport_max_backoff_seconds", 0.0);
  require_int("max_event_bytes", 256);
  require_type("redaction_placeholder", &jsonlite::Value::is_string, "a string");
  require_type("progress_log", &jsonlite::Value::is_string, "a string");
  require_type("follow_redirects", &jsonlite::Value::is_bool, "a boolean");
  require_type("verify_tls", &jsonlite::Value::is_bool, "a boolean");

  if (auto it = doc.find("retry_statuses"); it != doc.end()) {
    if (!it->second.is_array()) {
      r.errors.push_back("retry_statuses must be an array");
    } else {
      for (const auto& item : it->second.as_array()) {
        if (!item.is_int() || item.as_int() < 100 || item.as_int() > 599) {
          r.errors.push_back("retry_statuses entries must be HTTP status codes (100-599)");
          break;
        }
      }
    }
  }
  for (const char* key : {"retry_methods", "redact_fields"}) {
    auto it = doc.find(key);
    if (it == doc.end()) continue;
    bool ok = it->second.is_array();
    if (ok) {
      for (const auto& item : it->second.as_array()) ok = ok && item.is_string();
    }
    if (!ok) r.errors.push_back(std::string(key) + " must be an array of strings");
  }

  r.ok = r.errors.empty();
  return r;
}

std::string config_validation_to_json(const ConfigValidationResult& r) {
  jsonlite::Object o;
  o["ok"] = r.ok;
  o["config_version"] = r.config_version;
  jsonlite::Array errors;
  for (const auto& e : r.errors) errors.push_back(e);
  jsonlite::Array warnings;
  for (const auto& w : r.warnings) warnings.push_back(w);
  o["errors"] = errors;
  o["warnings"] = warnings;
  return jsonlite::to_json(o);
}

}  // namespace vigil
