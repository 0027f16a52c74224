#pragma once

#include "sandrun/common/cancel.hpp"
#include "sandrun/common/result.hpp"
#include "sandrun/http/client.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sandrun::sandbox {

struct SandboxEndpoints {
  std::string base_url;
  std::string health_path = "/api";
  std::uint64_t health_timeout_ms = 2000;
  std::uint64_t operation_timeout_ms = 60'000;
};

class SandboxClient {
public:
  SandboxClient(std::shared_ptr<http::HttpClient> http, SandboxEndpoints endpoints);

  [[nodiscard]] common::Status health(const common::CancelScope *cancel = nullptr) const;

  /// POST /api/automation/<action>. Non-2xx, timeout and transport errors are
  /// ExecutionFault; an aborted call is Cancelled.
  [[nodiscard]] common::Result<std::string>
  perform(const std::string &action, const std::string &body_json,
          const common::CancelScope *cancel = nullptr) const;

  [[nodiscard]] common::Result<std::string>
  navigate_to(const std::string &url, const common::CancelScope *cancel = nullptr) const;

  [[nodiscard]] const std::string &base_url() const { return endpoints_.base_url; }

private:
  std::shared_ptr<http::HttpClient> http_;
  SandboxEndpoints endpoints_;
};

[[nodiscard]] bool is_valid_action_name(const std::string &action);

} // namespace sandrun::sandbox
