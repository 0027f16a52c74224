#include "sandrun/http/client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <optional>

namespace sandrun::http {

namespace {

constexpr const char *kUserAgent = "sandrun/0.1";

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *cancel = static_cast<const common::CancelScope *>(clientp);
  return cancel != nullptr && cancel->cancelled() ? 1 : 0;
}

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse execute_request(const std::string &url, const std::optional<std::string> &body,
                             const std::uint64_t timeout_ms,
                             const common::CancelScope *cancel) {
  HttpResponse response;
  if (cancel != nullptr && cancel->cancelled()) {
    response.cancelled = true;
    response.network_error_message = "cancelled before request";
    return response;
  }

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
  // Worker threads issue requests concurrently; signals are not thread-safe.
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<common::CancelScope *>(cancel));

  struct curl_slist *header_list = nullptr;
  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    header_list = curl_slist_append(header_list, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    response.cancelled = true;
    response.network_error_message = "cancelled";
  } else if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

std::string HttpResponse::describe() const {
  if (cancelled) {
    return "cancelled";
  }
  if (timeout) {
    return "timeout";
  }
  if (network_error) {
    return network_error_message.empty() ? std::string("network error") : network_error_message;
  }
  return "HTTP " + std::to_string(status);
}

CurlHttpClient::CurlHttpClient() { ensure_curl_global_init(); }

HttpResponse CurlHttpClient::get(const std::string &url, const std::uint64_t timeout_ms,
                                 const common::CancelScope *cancel) {
  return execute_request(url, std::nullopt, timeout_ms, cancel);
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const std::string &body,
                                       const std::uint64_t timeout_ms,
                                       const common::CancelScope *cancel) {
  return execute_request(url, body, timeout_ms, cancel);
}

} // namespace sandrun::http
