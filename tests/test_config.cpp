#include "test_framework.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace {

using sandrun::testing::EnvGuard;
using sandrun::testing::TempDir;

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    if (next.has_value()) {
      sandrun::config::set_config_path_override(*next);
    } else {
      sandrun::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() { sandrun::config::clear_config_path_override(); }
};

// Env overrides read by load_config, cleared so the host environment cannot leak in.
struct CleanEnv {
  EnvGuard image{"SANDRUN_SANDBOX_IMAGE", std::nullopt};
  EnvGuard runtime{"SANDRUN_SANDBOX_RUNTIME", std::nullopt};
  EnvGuard db{"SANDRUN_QUEUE_DB", std::nullopt};
  EnvGuard max_size{"SANDRUN_POOL_MAX_SIZE", std::nullopt};
  EnvGuard attempts{"SANDRUN_MAX_ATTEMPTS", std::nullopt};
  EnvGuard env_file{"SANDRUN_ENV_FILE", std::nullopt};
  EnvGuard config_path{"SANDRUN_CONFIG_PATH", std::nullopt};
};

} // namespace

void register_config_tests(std::vector<sandrun::tests::TestCase> &tests) {
  using sandrun::tests::require;
  namespace cfg = sandrun::config;

  tests.push_back({"config_defaults_when_file_missing", [] {
                     const TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard guard;

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.sandbox.runtime == "docker", "runtime default");
                     require(config.sandbox.container_port == 8003, "container port default");
                     require(config.sandbox.health_path == "/api", "health path default");
                     require(config.sandbox.probe_failure_threshold == 3, "threshold default");
                     require(config.pool.max_size == 2, "pool max default");
                     require(config.queue.max_attempts == 3, "max attempts default");

                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home.path() / ".sandrun" / "config.toml",
                             "config path should live under ~/.sandrun");
                   }});

  tests.push_back({"config_parses_every_section", [] {
                     auto parsed = cfg::parse_config(R"(
[sandbox]
runtime = "process"
command = ["automation-service", "--port", "{port}"]
health_path = "/healthz"
health_max_attempts = 10
probe_interval_ms = 7000
probe_failure_threshold = 4
port_range_start = 19000
port_range_end = 19010

[pool]
max_size = 4
min_ready = 1
acquire_timeout_ms = 3000
eager_replace = false

[queue]
db_path = "/tmp/sandrun-jobs.db"
visibility_timeout_secs = 90
max_attempts = 5

[observability]
backend = "none"

[worker]
state_file = "/tmp/sandrun-state.json"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.sandbox.runtime == "process", "runtime");
                     require(config.sandbox.command.size() == 3, "command size");
                     require(config.sandbox.command[2] == "{port}", "command placeholder");
                     require(config.sandbox.health_path == "/healthz", "health path");
                     require(config.sandbox.health_max_attempts == 10, "health attempts");
                     require(config.sandbox.probe_interval_ms == 7000, "probe interval");
                     require(config.sandbox.probe_failure_threshold == 4, "probe threshold");
                     require(config.sandbox.port_range_start == 19000, "port start");
                     require(config.pool.max_size == 4, "max size");
                     require(config.pool.min_ready == 1, "min ready");
                     require(config.pool.acquire_timeout_ms == 3000, "acquire timeout");
                     require(!config.pool.eager_replace, "eager replace");
                     require(config.queue.db_path == "/tmp/sandrun-jobs.db", "db path");
                     require(config.queue.visibility_timeout_secs == 90, "visibility");
                     require(config.queue.max_attempts == 5, "attempts");
                     require(config.observability.backend == "none", "backend");
                     require(config.worker.state_file == "/tmp/sandrun-state.json", "state file");
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     const TempDir dir;
                     const CleanEnv clean;
                     dir.create_file("config.toml", "[pool]\nmax_size = 2\n[queue]\nmax_attempts = 3\n");
                     const ConfigOverrideGuard guard(dir.path() / "config.toml");
                     const EnvGuard max_size("SANDRUN_POOL_MAX_SIZE", std::string("6"));
                     const EnvGuard attempts("SANDRUN_MAX_ATTEMPTS", std::string("2"));
                     const EnvGuard runtime("SANDRUN_SANDBOX_RUNTIME", std::string(" Process "));

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().pool.max_size == 6, "env max size should win");
                     require(loaded.value().queue.max_attempts == 2, "env attempts should win");
                     require(loaded.value().sandbox.runtime == "process",
                             "runtime should be trimmed and lower-cased");
                   }});

  tests.push_back({"config_ignores_non_numeric_env_override", [] {
                     const TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard guard;
                     const EnvGuard max_size("SANDRUN_POOL_MAX_SIZE", std::string("lots"));

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().pool.max_size == 2, "bad value should be ignored");
                   }});

  tests.push_back({"config_rejects_out_of_range_env_override", [] {
                     const TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard guard;

                     for (const char *raw : {"-1", "4294967297", "5abc", " "}) {
                       const EnvGuard max_size("SANDRUN_POOL_MAX_SIZE", std::string(raw));
                       const EnvGuard attempts("SANDRUN_MAX_ATTEMPTS", std::string(raw));
                       auto loaded = cfg::load_config();
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().pool.max_size == 2,
                               std::string("max size should keep default for ") + raw);
                       require(loaded.value().queue.max_attempts == 3,
                               std::string("attempts should keep default for ") + raw);
                       require(cfg::validate_config(loaded.value()).ok(), "defaults validate");
                     }

                     const EnvGuard max_size("SANDRUN_POOL_MAX_SIZE", std::string("4294967295"));
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().pool.max_size == 4294967295U,
                             "largest representable value is accepted");
                   }});

  tests.push_back({"config_rejects_out_of_range_file_values", [] {
                     for (const char *text :
                          {"[sandbox]\ncontainer_port = 70000\n",
                           "[sandbox]\nport_range_start = 0\n",
                           "[sandbox]\nport_range_end = -1\n",
                           "[pool]\nmax_size = 4294967297\n",
                           "[queue]\nmax_attempts = 4294967296\n"}) {
                       auto parsed = cfg::parse_config(text);
                       require(!parsed.ok(), std::string("should reject: ") + text);
                     }
                     auto parsed = cfg::parse_config("[sandbox]\nport_range_end = 65535\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().sandbox.port_range_end == 65535, "top port kept");
                   }});

  tests.push_back({"config_dotenv_fills_unset_variables_only", [] {
                     const TempDir home;
                     const EnvGuard env_home("HOME", home.path().string());
                     const CleanEnv clean;
                     const ConfigOverrideGuard guard;
                     home.create_file("custom.env", "SANDRUN_SANDBOX_IMAGE=from-dotenv:1\n"
                                                    "SANDRUN_MAX_ATTEMPTS=4\n");
                     const EnvGuard env_file("SANDRUN_ENV_FILE",
                                             (home.path() / "custom.env").string());
                     const EnvGuard attempts("SANDRUN_MAX_ATTEMPTS", std::string("7"));

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sandbox.image == "from-dotenv:1",
                             "dotenv should provide the image");
                     require(loaded.value().queue.max_attempts == 7,
                             "existing environment should win over dotenv");
                   }});

  tests.push_back({"config_rejects_malformed_toml", [] {
                     auto parsed = cfg::parse_config("[]\nmax_size = 2\n");
                     require(!parsed.ok(), "empty section header should fail");
                   }});

  tests.push_back({"config_validation_hard_errors", [] {
                     cfg::Config config;
                     require(cfg::validate_config(config).ok(), "defaults should validate");

                     auto bad_runtime = config;
                     bad_runtime.sandbox.runtime = "podman";
                     require(!cfg::validate_config(bad_runtime).ok(), "unknown runtime");

                     auto no_command = config;
                     no_command.sandbox.runtime = "process";
                     no_command.sandbox.command.clear();
                     require(!cfg::validate_config(no_command).ok(), "process without command");

                     auto zero_pool = config;
                     zero_pool.pool.max_size = 0;
                     require(!cfg::validate_config(zero_pool).ok(), "max_size zero");

                     auto min_ready = config;
                     min_ready.pool.min_ready = 3;
                     require(!cfg::validate_config(min_ready).ok(), "min_ready above max");

                     auto attempts = config;
                     attempts.queue.max_attempts = 0;
                     require(!cfg::validate_config(attempts).ok(), "max_attempts zero");

                     auto threshold = config;
                     threshold.sandbox.probe_failure_threshold = 0;
                     require(!cfg::validate_config(threshold).ok(), "threshold zero");

                     auto ports = config;
                     ports.sandbox.port_range_end = static_cast<std::uint16_t>(
                         ports.sandbox.port_range_start - 1);
                     require(!cfg::validate_config(ports).ok(), "empty port range");

                     auto path = config;
                     path.sandbox.health_path = "api";
                     require(!cfg::validate_config(path).ok(), "relative health path");
                   }});

  tests.push_back({"config_validation_warnings", [] {
                     cfg::Config config;
                     config.sandbox.probe_interval_ms = 100;
                     config.sandbox.health_timeout_ms = 2000;
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(!validated.value().empty(), "short probe interval should warn");
                   }});
}
