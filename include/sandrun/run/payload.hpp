#pragma once

#include "sandrun/common/result.hpp"

#include <string>
#include <vector>

namespace sandrun::run {

struct AutomationStep {
  std::string action;
  std::string params_json = "{}";
};

/// Parses `{"steps":[{"action":"...","params":{...}}, ...]}`. Anything else, including an
/// empty step list or an action outside [A-Za-z0-9_], fails with InvalidPayload.
[[nodiscard]] common::Result<std::vector<AutomationStep>> parse_payload(const std::string &payload);

} // namespace sandrun::run
