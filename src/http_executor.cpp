#include "vigil/http_executor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>

#include "vigil/log.hpp"
#include "vigil/observability.hpp"

namespace vigil {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string scalar_text(const Value& v) {
  if (v.is_string()) return v.as_string();
  if (v.is_bool()) return v.as_bool() ? "true" : "false";
  return jsonlite::to_json(v);
}

// Null entries are dropped from what goes on the wire.
HeaderList to_pairs(const Value* v) {
  HeaderList out;
  if (!v || !v->is_object()) return out;
  for (const auto& [k, item] : v->as_object()) {
    if (item.is_null()) continue;
    out.emplace_back(k, scalar_text(item));
  }
  return out;
}

Object pairs_to_object(const HeaderList& pairs) {
  Object o;
  for (const auto& [k, v] : pairs) {
    auto it = o.find(k);
    if (it == o.end()) {
      o[k] = v;
    } else {
      it->second = it->second.as_string() + ", " + v;
    }
  }
  return o;
}

bool has_header(const HeaderList& headers, const std::string& name) {
  const std::string want = lower(name);
  return std::any_of(headers.begin(), headers.end(),
                     [&](const auto& h) { return lower(h.first) == want; });
}

// True when s holds an unrendered {{ secret.<path> }} placeholder.
bool has_secret_template(const std::string& s) {
  static const std::string kRoot = "secret.";
  size_t open = 0;
  while ((open = s.find("{{", open)) != std::string::npos) {
    size_t i = open + 2;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (s.size() - i > kRoot.size() && lower(s.substr(i, kRoot.size())) == kRoot) {
      const size_t path = i + kRoot.size();
      const size_t stop = s.find_first_of("{}", path);
      if (stop != std::string::npos && stop > path && s.compare(stop, 2, "}}") == 0) return true;
    }
    open += 2;
  }
  return false;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

// ---------------------------------------------------------------------------
// RequestSpec
// ---------------------------------------------------------------------------

RequestSpec RequestSpec::from_inputs(const Object& inputs) {
  RequestSpec spec;
  if (auto it = inputs.find("method"); it != inputs.end() && !it->second.is_null()) {
    spec.method = upper(scalar_text(it->second));
  }
  auto url = inputs.find("url");
  if (url == inputs.end() || !url->second.is_string() || url->second.as_string().empty()) {
    throw std::invalid_argument("HTTP step requires a non-empty URL");
  }
  spec.url = url->second.as_string();

  const Value root{inputs};
  spec.headers = to_pairs(root.find("headers"));
  spec.params = to_pairs(root.find("params"));

  if (auto it = inputs.find("json"); it != inputs.end()) {
    spec.json = it->second;
  } else if (auto b = inputs.find("body"); b != inputs.end()) {
    const Value& body = b->second;
    if (body.is_object() || body.is_array()) {
      spec.json = body;
    } else if (!body.is_null()) {
      spec.body_text = scalar_text(body);
    }
  }
  return spec;
}

std::string url_encode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string RequestSpec::full_url() const {
  if (params.empty()) return url;
  std::string out = url;
  out += (url.find('?') == std::string::npos) ? '?' : '&';
  bool first = true;
  for (const auto& [k, v] : params) {
    if (!first) out += '&';
    first = false;
    out += url_encode(k) + "=" + url_encode(v);
  }
  return out;
}

std::string host_key(const std::string& url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos) return normalize_host(url);
  const size_t start = scheme + 3;
  const size_t end = url.find_first_of("/?#", start);
  std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
  if (const auto at = authority.rfind('@'); at != std::string::npos) authority = authority.substr(at + 1);
  return normalize_host(authority);
}

// ---------------------------------------------------------------------------
// Redaction and truncation
// ---------------------------------------------------------------------------

Redactor::Redactor(const EngineConfig& config, std::vector<std::string> secrets)
    : placeholder(config.redaction_placeholder.empty() ? "***" : config.redaction_placeholder),
      secret_values(std::move(secrets)) {
  fields.reserve(config.redact_fields.size());
  for (const auto& f : config.redact_fields) fields.push_back(lower(f));
  // Longest first so a secret that contains another is masked whole.
  std::sort(secret_values.begin(), secret_values.end(),
            [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

std::string Redactor::apply_string(const std::string& s) const {
  if (s.empty()) return s;
  if (has_secret_template(s)) return placeholder;
  std::string out = s;
  for (const auto& secret : secret_values) {
    if (secret.empty()) continue;
    size_t pos = 0;
    while ((pos = out.find(secret, pos)) != std::string::npos) {
      out.replace(pos, secret.size(), placeholder);
      pos += placeholder.size();
    }
  }
  return out;
}

Object Redactor::apply(const Object& o) const {
  Object out;
  for (const auto& [k, v] : o) {
    if (std::find(fields.begin(), fields.end(), lower(k)) != fields.end()) {
      out[k] = placeholder;
    } else {
      out[k] = apply(v);
    }
  }
  return out;
}

Value Redactor::apply(const Value& v) const {
  if (v.is_object()) return apply(v.as_object());
  if (v.is_array()) {
    Array out;
    out.reserve(v.as_array().size());
    for (const auto& item : v.as_array()) out.push_back(apply(item));
    return out;
  }
  if (v.is_string()) return apply_string(v.as_string());
  if ((v.is_number() || v.is_bool()) &&
      std::find(secret_values.begin(), secret_values.end(), scalar_text(v)) != secret_values.end()) {
    return placeholder;
  }
  return v;
}

std::string Redactor::apply_url(const std::string& url) const {
  const auto q = url.find('?');
  if (q == std::string::npos) return apply_string(url);
  const auto hash = url.find('#', q);
  const std::string query = url.substr(q + 1, hash == std::string::npos ? std::string::npos : hash - q - 1);
  std::string out = url.substr(0, q + 1);
  size_t pos = 0;
  bool first = true;
  while (pos <= query.size()) {
    size_t amp = query.find('&', pos);
    if (amp == std::string::npos) amp = query.size();
    const std::string pair = query.substr(pos, amp - pos);
    if (!first) out += '&';
    first = false;
    const auto eq = pair.find('=');
    const std::string name = pair.substr(0, eq);
    if (eq != std::string::npos && std::find(fields.begin(), fields.end(), lower(name)) != fields.end()) {
      out += name + "=" + placeholder;
    } else {
      out += pair;
    }
    pos = amp + 1;
  }
  if (hash != std::string::npos) out += url.substr(hash);
  return apply_string(out);
}

TruncatedText truncate_body(const std::string& text, std::uint64_t limit) {
  TruncatedText out;
  if (text.size() <= limit) {
    out.text = text;
    return out;
  }
  size_t cut = static_cast<size_t>(limit);
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  out.text = text.substr(0, cut);
  out.truncated = true;
  out.note = "Body truncated to " + std::to_string(limit) + " bytes from " + std::to_string(text.size()) +
             " bytes";
  return out;
}

// ---------------------------------------------------------------------------
// HttpStepExecutor
// ---------------------------------------------------------------------------

HttpStepExecutor::HttpStepExecutor(EngineConfig config, std::shared_ptr<ITransport> transport, Sleeper sleeper)
    : config_(std::move(config)), transport_(std::move(transport)), sleeper_(std::move(sleeper)) {
  if (!transport_) transport_ = std::make_shared<CurlTransport>();
  if (!sleeper_) sleeper_ = sleep_seconds;
}

double HttpStepExecutor::transport_backoff(std::uint32_t attempt) const {
  if (attempt == 0) return 0.0;
  const double factor = std::max(0.1, config_.transport_backoff_factor);
  const double delay = factor * std::pow(2.0, static_cast<double>(attempt - 1));
  return std::min(delay, config_.transport_max_backoff_seconds);
}

bool HttpStepExecutor::should_retry_status(const std::string& method, int status_code) const {
  if (!config_.retry_statuses.contains(status_code)) return false;
  if (config_.retry_methods.empty()) return true;
  return config_.retry_methods.contains(upper(method));
}

StepResult HttpStepExecutor::execute(const Object& inputs, ExecutionContext& context, double timeout_seconds) {
  const RequestSpec spec = RequestSpec::from_inputs(inputs);
  const Redactor redactor(config_, context.secret_values());

  TransportRequest req;
  req.method = spec.method;
  req.url = spec.full_url();
  req.headers = spec.headers;
  req.timeout_seconds = timeout_seconds > 0.0 ? timeout_seconds : config_.request_timeout_seconds;
  req.follow_redirects = config_.follow_redirects;
  req.verify_tls = config_.verify_tls;

  Object request_record;
  request_record["method"] = spec.method;
  request_record["url"] = spec.url;
  if (!spec.params.empty()) request_record["params"] = pairs_to_object(spec.params);

  if (spec.json) {
    req.body = jsonlite::to_json(*spec.json);
    req.has_body = true;
    if (!has_header(req.headers, "content-type")) req.headers.emplace_back("Content-Type", "application/json");
    request_record["json"] = *spec.json;
  } else if (spec.body_text) {
    req.body = *spec.body_text;
    req.has_body = true;
    const auto t = truncate_body(*spec.body_text, config_.max_response_size_bytes);
    Object body{{"text", t.text}, {"truncated", t.truncated}};
    if (t.truncated) body["note"] = t.note;
    request_record["body"] = std::move(body);
  }
  if (!req.headers.empty()) request_record["headers"] = pairs_to_object(req.headers);
  request_record = redactor.apply(request_record);
  request_record["url"] = redactor.apply_url(spec.url);

  const std::uint32_t max_attempts = std::max<std::uint32_t>(1, config_.transport_retry_attempts);
  auto& stats = global_engine_stats();
  const auto start = std::chrono::steady_clock::now();

  std::uint32_t attempts = 0;
  TransportResult last;
  while (attempts < max_attempts) {
    ++attempts;
    last = transport_->perform(req);
    if (!last.ok) {
      stats.transport_errors.fetch_add(1, std::memory_order_relaxed);
      log_warn("http_executor", last.error_code == ErrorCode::transport_timeout ? "transport_timeout"
                                                                                 : "transport_error",
               {{"attempt", attempts}, {"method", req.method}, {"url", redactor.apply_url(req.url)},
                {"error", last.error}, {"error_code", to_string(last.error_code)}});
      if (attempts >= max_attempts) break;
      stats.transport_retries.fetch_add(1, std::memory_order_relaxed);
      sleeper_(transport_backoff(attempts));
      continue;
    }
    if (attempts < max_attempts && should_retry_status(req.method, last.response.status_code)) {
      log_info("http_executor", "retry_status",
               {{"attempt", attempts}, {"method", req.method}, {"url", redactor.apply_url(req.url)},
                {"status_code", last.response.status_code}});
      stats.transport_retries.fetch_add(1, std::memory_order_relaxed);
      sleeper_(transport_backoff(attempts));
      continue;
    }
    break;
  }

  const auto duration_ms = static_cast<std::int64_t>(elapsed_ms(start));
  const std::uint32_t retries = attempts > 0 ? attempts - 1 : 0;

  if (!last.ok) {
    const std::string message = last.error.empty() ? "HTTP request failed" : redactor.apply_string(last.error);
    Object metrics;
    metrics["duration_ms"] = duration_ms;
    metrics["status"] = "network_error";
    metrics["response_size"] = 0;
    metrics["attempts"] = attempts;
    metrics["retries"] = retries;
    metrics["error"] = message;
    metrics["error_code"] = to_string(last.error_code);
    throw TransportError(message, last.error_code, std::move(request_record), std::move(metrics));
  }

  const TransportResponse& resp = last.response;
  const Object headers = pairs_to_object(resp.headers);

  std::optional<jsonlite::JsonError> parse_error;
  Value json;
  bool has_json = false;
  if (!resp.body.empty()) {
    json = jsonlite::parse_value(resp.body, &parse_error);
    has_json = !parse_error.has_value();
    if (!has_json) json = nullptr;
  }

  const auto body = truncate_body(resp.body, config_.max_response_size_bytes);
  Object body_record{{"text", body.text}, {"truncated", body.truncated}};
  if (body.truncated) body_record["note"] = body.note;

  Object response_record;
  response_record["status_code"] = resp.status_code;
  response_record["headers"] = headers;
  response_record["body"] = std::move(body_record);
  if (has_json) response_record["json"] = json;

  StepResult result;
  result.request_payload = std::move(request_record);
  result.response_payload = redactor.apply(response_record);

  result.metrics["duration_ms"] = duration_ms;
  result.metrics["status"] = "completed";
  result.metrics["response_size"] = resp.body.size();
  result.metrics["status_code"] = resp.status_code;
  result.metrics["attempts"] = attempts;
  result.metrics["retries"] = retries;

  result.context_data["status_code"] = resp.status_code;
  result.context_data["headers"] = headers;
  result.context_data["body"] = resp.body;
  result.context_data["json"] = json;

  context.set_current_response(Value{result.context_data});
  log_debug("http_executor", "completed",
            {{"method", req.method}, {"url", redactor.apply_url(req.url)},
             {"status_code", resp.status_code}, {"attempts", attempts}, {"duration_ms", duration_ms}});
  return result;
}

}  // namespace vigil
