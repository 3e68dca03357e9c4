#include "vigil/http_executor.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

#include "vigil/log.hpp"

namespace vigil {

namespace {

std::once_flag g_curl_init;

// Query strings carry rendered params, which may be credentials.
std::string url_without_query(const std::string& url) {
  return url.substr(0, url.find_first_of("?#"));
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// Collects "Name: value" lines. A new status line (redirect, 100-continue)
// starts the header list over.
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers = static_cast<HeaderList*>(userdata);
  const size_t len = size * nitems;
  std::string line(buffer, len);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
    return len;
  }
  const auto colon = line.find(':');
  if (colon == std::string::npos) return len;
  std::string name = line.substr(0, colon);
  std::string value = line.substr(colon + 1);
  const auto b = value.find_first_not_of(" \t");
  value = b == std::string::npos ? std::string{} : value.substr(b);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  headers->emplace_back(std::move(name), std::move(value));
  return len;
}

ErrorCode classify(CURLcode rc) {
  switch (rc) {
    case CURLE_OPERATION_TIMEDOUT: return ErrorCode::transport_timeout;
    case CURLE_COULDNT_CONNECT: return ErrorCode::transport_connect;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY: return ErrorCode::transport_dns;
    default: return ErrorCode::transport_other;
  }
}

struct EasyDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

}  // namespace

CurlTransport::CurlTransport() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

TransportResult CurlTransport::perform(const TransportRequest& request) {
  TransportResult result;
  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    result.error_code = ErrorCode::transport_other;
    result.error = "curl_easy_init failed";
    return result;
  }
  CURL* h = curl.get();

  curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    raw_headers = curl_slist_append(raw_headers, line.c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  char errbuf[CURL_ERROR_SIZE] = {0};
  const long timeout_ms = static_cast<long>(std::max(0.001, request.timeout_seconds) * 1000.0);

  curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &result.response.body);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &result.response.headers);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);

  if (request.method == "HEAD") {
    curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
  } else if (request.method != "GET" || request.has_body) {
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }
  if (request.has_body) {
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
  }

  const CURLcode rc = curl_easy_perform(h);
  if (rc != CURLE_OK) {
    result.error_code = classify(rc);
    result.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
    log_debug("curl_transport", "perform_failed",
              {{"url", url_without_query(request.url)}, {"curl_code", static_cast<int>(rc)}, {"error", result.error}});
    return result;
  }

  long status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  result.ok = true;
  result.response.status_code = static_cast<int>(status);
  return result;
}

}  // namespace vigil
