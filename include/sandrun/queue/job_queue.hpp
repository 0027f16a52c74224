#pragma once

#include "sandrun/common/result.hpp"
#include "sandrun/queue/job.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>

namespace sandrun::queue {

class IJobQueue {
public:
  virtual ~IJobQueue() = default;

  [[nodiscard]] virtual common::Result<std::int64_t> enqueue(const std::string &run_id,
                                                             const std::string &payload) = 0;
  [[nodiscard]] virtual common::Result<std::optional<Delivery>> receive() = 0;
  [[nodiscard]] virtual common::Status ack(std::int64_t delivery_id) = 0;
  [[nodiscard]] virtual common::Status requeue(std::int64_t delivery_id, std::uint32_t attempt,
                                               std::chrono::milliseconds delay) = 0;
  [[nodiscard]] virtual common::Status extend_lease(std::int64_t delivery_id) = 0;
};

class SqliteJobQueue final : public IJobQueue {
public:
  SqliteJobQueue(std::filesystem::path db_path, std::chrono::seconds visibility_timeout);
  ~SqliteJobQueue() override;

  SqliteJobQueue(const SqliteJobQueue &) = delete;
  SqliteJobQueue &operator=(const SqliteJobQueue &) = delete;

  [[nodiscard]] common::Status open();

  [[nodiscard]] common::Result<std::int64_t> enqueue(const std::string &run_id,
                                                     const std::string &payload) override;
  [[nodiscard]] common::Result<std::optional<Delivery>> receive() override;
  [[nodiscard]] common::Status ack(std::int64_t delivery_id) override;
  [[nodiscard]] common::Status requeue(std::int64_t delivery_id, std::uint32_t attempt,
                                       std::chrono::milliseconds delay) override;
  [[nodiscard]] common::Status extend_lease(std::int64_t delivery_id) override;

  [[nodiscard]] common::Result<std::size_t> depth();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status update_one(const char *sql, std::int64_t delivery_id,
                                          std::int64_t value, std::optional<std::int64_t> attempt);

  std::filesystem::path db_path_;
  std::chrono::seconds visibility_timeout_;
  std::mutex mutex_;
  sqlite3 *db_ = nullptr;
};

} // namespace sandrun::queue
