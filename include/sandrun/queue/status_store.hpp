#pragma once

#include "sandrun/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace sandrun::queue {

enum class RunState {
  Running,
  Succeeded,
  Failed,
  PermanentlyFailed,
};

[[nodiscard]] std::string run_state_to_string(RunState state);
[[nodiscard]] std::optional<RunState> run_state_from_string(const std::string &value);

struct RunStatusRecord {
  std::string run_id;
  RunState state = RunState::Running;
  std::string detail;
  std::uint32_t attempt = 1;
  std::int64_t updated_at_ms = 0;

  [[nodiscard]] std::string to_json() const;
};

class IStatusStore {
public:
  virtual ~IStatusStore() = default;

  [[nodiscard]] virtual common::Status report(const RunStatusRecord &record) = 0;
  [[nodiscard]] virtual common::Result<std::optional<RunStatusRecord>>
  get(const std::string &run_id) = 0;
};

class SqliteStatusStore final : public IStatusStore {
public:
  explicit SqliteStatusStore(std::filesystem::path db_path);
  ~SqliteStatusStore() override;

  SqliteStatusStore(const SqliteStatusStore &) = delete;
  SqliteStatusStore &operator=(const SqliteStatusStore &) = delete;

  [[nodiscard]] common::Status open();

  [[nodiscard]] common::Status report(const RunStatusRecord &record) override;
  [[nodiscard]] common::Result<std::optional<RunStatusRecord>>
  get(const std::string &run_id) override;

private:
  std::filesystem::path db_path_;
  std::mutex mutex_;
  sqlite3 *db_ = nullptr;
};

} // namespace sandrun::queue
