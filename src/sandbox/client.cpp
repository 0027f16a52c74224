#include "sandrun/sandbox/client.hpp"

#include "sandrun/common/json_util.hpp"

#include <algorithm>
#include <cctype>

namespace sandrun::sandbox {

bool is_valid_action_name(const std::string &action) {
  return !action.empty() && std::all_of(action.begin(), action.end(), [](const char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

SandboxClient::SandboxClient(std::shared_ptr<http::HttpClient> http, SandboxEndpoints endpoints)
    : http_(std::move(http)), endpoints_(std::move(endpoints)) {}

common::Status SandboxClient::health(const common::CancelScope *cancel) const {
  const auto response = http_->get(endpoints_.base_url + endpoints_.health_path,
                                   endpoints_.health_timeout_ms, cancel);
  if (response.ok()) {
    return common::Status::success();
  }
  if (response.cancelled) {
    return common::Status::error(common::ErrorKind::Cancelled, "health check cancelled");
  }
  return common::Status::error("health check failed: " + response.describe());
}

common::Result<std::string> SandboxClient::perform(const std::string &action,
                                                   const std::string &body_json,
                                                   const common::CancelScope *cancel) const {
  if (!is_valid_action_name(action)) {
    return common::Result<std::string>::failure(common::ErrorKind::InvalidPayload,
                                                "invalid automation action: " + action);
  }
  const auto response =
      http_->post_json(endpoints_.base_url + "/api/automation/" + action,
                       body_json.empty() ? std::string("{}") : body_json,
                       endpoints_.operation_timeout_ms, cancel);
  if (response.cancelled) {
    return common::Result<std::string>::failure(common::ErrorKind::Cancelled,
                                                action + " cancelled");
  }
  if (!response.ok()) {
    std::string message = action + " failed: " + response.describe();
    if (!response.body.empty() && response.status != 0) {
      message += " " + response.body.substr(0, 200);
    }
    return common::Result<std::string>::failure(common::ErrorKind::ExecutionFault, message);
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::string> SandboxClient::navigate_to(const std::string &url,
                                                       const common::CancelScope *cancel) const {
  return perform("navigate_to", "{\"url\":\"" + common::json_escape(url) + "\"}", cancel);
}

} // namespace sandrun::sandbox
