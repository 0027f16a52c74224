#include "sandrun/config/config.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace sandrun::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sandrun";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SANDRUN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Existing environment wins over .env files.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SANDRUN_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }
  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

// Unsigned override; anything that is not a plain in-range decimal keeps the current value.
template <typename T> void override_unsigned(const char *name, T &target) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return;
  }
  const std::string text = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (text.empty() || ec != std::errc() || ptr != last ||
      parsed > std::numeric_limits<T>::max()) {
    std::cerr << "[config] ignoring " << name << "='" << raw << "', keeping " << target << "\n";
    return;
  }
  target = static_cast<T>(parsed);
}

common::Status read_port(const common::TomlDocument &doc, const std::string &key,
                         std::uint16_t &target) {
  const int value = doc.get_int(key, target);
  if (value < 1 || value > std::numeric_limits<std::uint16_t>::max()) {
    return common::Status::error(key + " must be 1-65535");
  }
  target = static_cast<std::uint16_t>(value);
  return common::Status::success();
}

common::Status read_u32(const common::TomlDocument &doc, const std::string &key,
                        std::uint32_t &target) {
  const std::uint64_t value = doc.get_u64(key, target);
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return common::Status::error(key + " is out of range");
  }
  target = static_cast<std::uint32_t>(value);
  return common::Status::success();
}

common::Status load_sandbox_section(SandboxConfig &sandbox, const common::TomlDocument &doc) {
  sandbox.runtime = common::to_lower(doc.get_string("sandbox.runtime", sandbox.runtime));
  sandbox.image = doc.get_string("sandbox.image", sandbox.image);
  sandbox.container_prefix = doc.get_string("sandbox.container_prefix", sandbox.container_prefix);
  sandbox.host = doc.get_string("sandbox.host", sandbox.host);
  if (auto status = read_port(doc, "sandbox.container_port", sandbox.container_port);
      !status.ok()) {
    return status;
  }
  if (auto status = read_port(doc, "sandbox.port_range_start", sandbox.port_range_start);
      !status.ok()) {
    return status;
  }
  if (auto status = read_port(doc, "sandbox.port_range_end", sandbox.port_range_end);
      !status.ok()) {
    return status;
  }
  sandbox.command = doc.get_string_array("sandbox.command", sandbox.command);
  sandbox.shm_size = doc.get_string("sandbox.shm_size", sandbox.shm_size);

  sandbox.health_path = doc.get_string("sandbox.health_path", sandbox.health_path);
  sandbox.prewarm_url = doc.get_string("sandbox.prewarm_url", sandbox.prewarm_url);
  if (auto status = read_u32(doc, "sandbox.health_max_attempts", sandbox.health_max_attempts);
      !status.ok()) {
    return status;
  }
  sandbox.health_interval_ms =
      doc.get_u64("sandbox.health_interval_ms", sandbox.health_interval_ms);
  sandbox.health_timeout_ms = doc.get_u64("sandbox.health_timeout_ms", sandbox.health_timeout_ms);
  sandbox.probe_interval_ms = doc.get_u64("sandbox.probe_interval_ms", sandbox.probe_interval_ms);
  if (auto status =
          read_u32(doc, "sandbox.probe_failure_threshold", sandbox.probe_failure_threshold);
      !status.ok()) {
    return status;
  }
  sandbox.operation_timeout_ms =
      doc.get_u64("sandbox.operation_timeout_ms", sandbox.operation_timeout_ms);
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *image = std::getenv("SANDRUN_SANDBOX_IMAGE"); image != nullptr && *image) {
    config.sandbox.image = image;
  }
  if (const char *runtime = std::getenv("SANDRUN_SANDBOX_RUNTIME");
      runtime != nullptr && *runtime) {
    config.sandbox.runtime = common::to_lower(common::trim(runtime));
  }
  if (const char *db = std::getenv("SANDRUN_QUEUE_DB"); db != nullptr && *db) {
    config.queue.db_path = db;
  }
  override_unsigned("SANDRUN_POOL_MAX_SIZE", config.pool.max_size);
  override_unsigned("SANDRUN_MAX_ATTEMPTS", config.queue.max_attempts);
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  if (auto status = load_sandbox_section(config.sandbox, doc); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }

  for (const auto &[key, target] : std::vector<std::pair<std::string, std::uint32_t *>>{
           {"pool.max_size", &config.pool.max_size},
           {"pool.min_ready", &config.pool.min_ready},
           {"queue.max_attempts", &config.queue.max_attempts}}) {
    if (auto status = read_u32(doc, key, *target); !status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
  }
  config.pool.acquire_timeout_ms =
      doc.get_u64("pool.acquire_timeout_ms", config.pool.acquire_timeout_ms);
  config.pool.eager_replace = doc.get_bool("pool.eager_replace", config.pool.eager_replace);

  config.queue.db_path = doc.get_string("queue.db_path", config.queue.db_path);
  config.queue.poll_interval_ms = doc.get_u64("queue.poll_interval_ms", config.queue.poll_interval_ms);
  config.queue.visibility_timeout_secs =
      doc.get_u64("queue.visibility_timeout_secs", config.queue.visibility_timeout_secs);
  config.queue.requeue_delay_ms =
      doc.get_u64("queue.requeue_delay_ms", config.queue.requeue_delay_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.worker.state_file = doc.get_string("worker.state_file", config.worker.state_file);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Out = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &sandbox = config.sandbox;
  if (sandbox.runtime != "docker" && sandbox.runtime != "process") {
    return Out::failure("Invalid sandbox.runtime: " + sandbox.runtime);
  }
  if (sandbox.runtime == "docker" && common::trim(sandbox.image).empty()) {
    return Out::failure("sandbox.image is required for the docker runtime");
  }
  if (sandbox.runtime == "process" && sandbox.command.empty()) {
    return Out::failure("sandbox.command is required for the process runtime");
  }
  if (sandbox.port_range_start == 0 || sandbox.port_range_end < sandbox.port_range_start) {
    return Out::failure("sandbox.port_range_start..port_range_end is empty");
  }
  if (sandbox.container_port == 0) {
    return Out::failure("sandbox.container_port must be 1-65535");
  }
  if (!common::starts_with(sandbox.health_path, "/")) {
    return Out::failure("sandbox.health_path must start with '/'");
  }
  if (sandbox.health_max_attempts == 0) {
    return Out::failure("sandbox.health_max_attempts must be > 0");
  }
  if (sandbox.probe_failure_threshold == 0) {
    return Out::failure("sandbox.probe_failure_threshold must be > 0");
  }
  if (sandbox.probe_interval_ms < sandbox.health_timeout_ms) {
    warnings.push_back("sandbox.probe_interval_ms is shorter than sandbox.health_timeout_ms");
  }

  if (config.pool.max_size == 0) {
    return Out::failure("pool.max_size must be > 0");
  }
  if (config.pool.min_ready > config.pool.max_size) {
    return Out::failure("pool.min_ready must not exceed pool.max_size");
  }
  const auto port_count =
      static_cast<std::uint32_t>(sandbox.port_range_end - sandbox.port_range_start) + 1;
  if (port_count < config.pool.max_size) {
    warnings.push_back("sandbox port range is smaller than pool.max_size");
  }

  if (config.queue.max_attempts == 0) {
    return Out::failure("queue.max_attempts must be > 0");
  }
  if (common::trim(config.queue.db_path).empty()) {
    return Out::failure("queue.db_path is required");
  }
  if (config.queue.visibility_timeout_secs * 1000 < config.queue.poll_interval_ms * 2) {
    warnings.push_back("queue.visibility_timeout_secs is very short compared to poll interval");
  }

  return Out::success(std::move(warnings));
}

} // namespace sandrun::config
