#include "sandrun/run/payload.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/common/json_util.hpp"
#include "sandrun/sandbox/client.hpp"

namespace sandrun::run {

common::Result<std::vector<AutomationStep>> parse_payload(const std::string &payload) {
  using Out = common::Result<std::vector<AutomationStep>>;
  const auto invalid = [](const std::string &message) {
    return Out::failure(common::ErrorKind::InvalidPayload, message);
  };

  const std::string body = common::trim(payload);
  if (!common::json_is_object(body)) {
    return invalid("payload is not a JSON object");
  }
  const auto fields = common::json_parse_flat(body);
  const auto steps_it = fields.find("steps");
  if (steps_it == fields.end() || !common::starts_with(steps_it->second, "[")) {
    return invalid("payload has no \"steps\" array");
  }

  std::vector<AutomationStep> steps;
  for (const auto &raw : common::json_split_top_level_objects(steps_it->second)) {
    const auto step = common::json_parse_flat(raw);
    const auto action = step.find("action");
    if (action == step.end() || !sandbox::is_valid_action_name(action->second)) {
      return invalid("step " + std::to_string(steps.size() + 1) + " has an invalid action");
    }
    AutomationStep parsed{.action = action->second};
    if (const auto params = step.find("params"); params != step.end()) {
      if (!common::json_is_object(params->second)) {
        return invalid("step " + std::to_string(steps.size() + 1) +
                       " params must be a JSON object");
      }
      parsed.params_json = params->second;
    }
    steps.push_back(std::move(parsed));
  }
  if (steps.empty()) {
    return invalid("payload has no steps");
  }
  return Out::success(std::move(steps));
}

} // namespace sandrun::run
