#include "sandrun/cli/commands.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/config/config.hpp"
#include "sandrun/observability/factory.hpp"
#include "sandrun/observability/global.hpp"
#include "sandrun/queue/job_queue.hpp"
#include "sandrun/queue/status_store.hpp"
#include "sandrun/run/payload.hpp"
#include "sandrun/worker/daemon.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace sandrun::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested.store(true); }

std::string version_string() {
#ifdef SANDRUN_VERSION
  std::string version = SANDRUN_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SANDRUN_GIT_COMMIT
  const std::string commit = SANDRUN_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "sandrun " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

common::Result<config::Config> load_validated_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  return cfg;
}

int run_worker(std::vector<std::string> args) {
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);
  long duration = 0;
  if (!duration_raw.empty()) {
    try {
      duration = std::stol(duration_raw);
    } catch (const std::exception &) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
  }

  observability::set_global_observer(observability::create_observer(cfg.value()));

  worker::WorkerDaemon daemon(cfg.value());
  auto started = daemon.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  std::cout << "Worker started (pool max " << cfg.value().pool.max_size << ", state "
            << daemon.state_file().string() << ")\n";

  g_stop_requested.store(false);
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
  while (!g_stop_requested.load()) {
    if (duration > 0 && std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  daemon.stop();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  std::cout << "Worker stopped\n";
  return 0;
}

int run_submit(std::vector<std::string> args) {
  std::string payload;
  std::string payload_file;
  const bool inline_payload = take_option(args, "--payload", "-p", payload);
  const bool file_payload = take_option(args, "--payload-file", "-f", payload_file);
  if (args.empty() || inline_payload == file_payload) {
    std::cerr << "usage: sandrun submit <run_id> (--payload JSON | --payload-file PATH)\n";
    return 1;
  }
  const std::string run_id = args[0];

  if (file_payload) {
    std::ifstream in(payload_file);
    if (!in) {
      std::cerr << "cannot read payload file: " << payload_file << "\n";
      return 1;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    payload = buffer.str();
  }
  payload = common::trim(payload);

  if (auto parsed = run::parse_payload(payload); !parsed.ok()) {
    std::cerr << "invalid payload: " << parsed.error() << "\n";
    return 1;
  }

  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  queue::SqliteJobQueue jobs(config::expand_config_path(cfg.value().queue.db_path),
                             std::chrono::seconds(cfg.value().queue.visibility_timeout_secs));
  if (auto opened = jobs.open(); !opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto enqueued = jobs.enqueue(run_id, payload);
  if (!enqueued.ok()) {
    std::cerr << enqueued.error() << "\n";
    return 1;
  }
  std::cout << "Enqueued run " << run_id << " (delivery " << enqueued.value() << ")\n";
  return 0;
}

int run_status(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: sandrun status <run_id>\n";
    return 1;
  }
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  queue::SqliteStatusStore store(config::expand_config_path(cfg.value().queue.db_path));
  if (auto opened = store.open(); !opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto record = store.get(args[0]);
  if (!record.ok()) {
    std::cerr << record.error() << "\n";
    return 1;
  }
  if (!record.value().has_value()) {
    std::cerr << "no status for run " << args[0] << "\n";
    return 1;
  }
  std::cout << record.value()->to_json() << "\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << " - sandboxed agent-run worker\n\n";
  std::cout << "Usage: sandrun [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  worker [--duration-secs N]         Run the worker until SIGINT/SIGTERM\n";
  std::cout << "  submit <run_id> --payload JSON     Enqueue a run\n";
  std::cout << "  submit <run_id> --payload-file F   Enqueue a run from a file\n";
  std::cout << "  status <run_id>                    Print the run's status record\n";
  std::cout << "  config-path                        Print the config file location\n";
  std::cout << "  --version                          Show version\n";
  std::cout << "  --help                             Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "worker") {
    return run_worker(std::move(args));
  }
  if (subcommand == "submit") {
    return run_submit(std::move(args));
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sandrun::cli
