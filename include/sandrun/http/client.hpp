#pragma once

#include "sandrun/common/cancel.hpp"

#include <cstdint>
#include <string>

namespace sandrun::http {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  bool cancelled = false;
  std::string network_error_message;

  [[nodiscard]] bool ok() const {
    return !timeout && !network_error && !cancelled && status >= 200 && status < 300;
  }

  [[nodiscard]] std::string describe() const;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, std::uint64_t timeout_ms,
                                         const common::CancelScope *cancel = nullptr) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const std::string &body,
                                               std::uint64_t timeout_ms,
                                               const common::CancelScope *cancel = nullptr) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse get(const std::string &url, std::uint64_t timeout_ms,
                                 const common::CancelScope *cancel = nullptr) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const std::string &body,
                                       std::uint64_t timeout_ms,
                                       const common::CancelScope *cancel = nullptr) override;
};

} // namespace sandrun::http
