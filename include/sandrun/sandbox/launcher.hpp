#pragma once

#include "sandrun/common/result.hpp"
#include "sandrun/config/schema.hpp"
#include "sandrun/sandbox/docker.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <sys/types.h>

namespace sandrun::sandbox {

struct SandboxHandle {
  std::string sandbox_id;
  std::string base_url;
  std::uint16_t port = 0;
  std::string container_name;
  pid_t pid = -1;
};

class ISandboxLauncher {
public:
  virtual ~ISandboxLauncher() = default;

  [[nodiscard]] virtual common::Result<SandboxHandle> launch(const std::string &sandbox_id) = 0;
  [[nodiscard]] virtual common::Status stop(const SandboxHandle &handle) = 0;
  [[nodiscard]] virtual bool is_alive(const SandboxHandle &handle) = 0;
};

class PortAllocator {
public:
  PortAllocator(std::string host, std::uint16_t first, std::uint16_t last);

  [[nodiscard]] common::Result<std::uint16_t> reserve();
  void release(std::uint16_t port);

private:
  std::string host_;
  std::uint16_t first_;
  std::uint16_t last_;
  std::mutex mutex_;
  std::set<std::uint16_t> reserved_;
};

class DockerSandboxLauncher final : public ISandboxLauncher {
public:
  DockerSandboxLauncher(config::SandboxConfig config, std::shared_ptr<IDockerRunner> runner);

  [[nodiscard]] common::Result<SandboxHandle> launch(const std::string &sandbox_id) override;
  [[nodiscard]] common::Status stop(const SandboxHandle &handle) override;
  [[nodiscard]] bool is_alive(const SandboxHandle &handle) override;

private:
  config::SandboxConfig config_;
  std::shared_ptr<IDockerRunner> runner_;
  PortAllocator ports_;
};

class ProcessSandboxLauncher final : public ISandboxLauncher {
public:
  explicit ProcessSandboxLauncher(config::SandboxConfig config,
                                  std::chrono::milliseconds stop_grace = std::chrono::seconds(5));

  [[nodiscard]] common::Result<SandboxHandle> launch(const std::string &sandbox_id) override;
  [[nodiscard]] common::Status stop(const SandboxHandle &handle) override;
  [[nodiscard]] bool is_alive(const SandboxHandle &handle) override;

private:
  config::SandboxConfig config_;
  std::chrono::milliseconds stop_grace_;
  PortAllocator ports_;
  std::mutex mutex_;
  std::set<pid_t> exited_;
};

[[nodiscard]] std::string sandbox_base_url(const std::string &host, std::uint16_t port);

[[nodiscard]] common::Result<std::shared_ptr<ISandboxLauncher>>
create_launcher(const config::SandboxConfig &config);

} // namespace sandrun::sandbox
