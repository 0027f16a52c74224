#pragma once

#include "sandrun/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace sandrun::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] std::string replace_all(std::string value, const std::string &from,
                                      const std::string &to);

[[nodiscard]] std::int64_t unix_millis(std::chrono::system_clock::time_point time_point =
                                           std::chrono::system_clock::now());
[[nodiscard]] std::string now_rfc3339();

} // namespace sandrun::common
