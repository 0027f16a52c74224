#include "sandrun/queue/job_queue.hpp"

#include "sandrun/common/fs.hpp"
#include "sqlite_internal.hpp"

namespace sandrun::queue {

namespace {

constexpr const char *kNotOpen = "job queue is not open";

} // namespace

SqliteJobQueue::SqliteJobQueue(std::filesystem::path db_path,
                               const std::chrono::seconds visibility_timeout)
    : db_path_(std::move(db_path)), visibility_timeout_(visibility_timeout) {}

SqliteJobQueue::~SqliteJobQueue() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteJobQueue::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }
  auto opened = internal::open_database(db_path_);
  if (!opened.ok()) {
    return opened.status();
  }
  db_ = opened.value();
  return init_schema();
}

common::Status SqliteJobQueue::init_schema() {
  return internal::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS jobs (
  delivery_id INTEGER PRIMARY KEY AUTOINCREMENT,
  run_id TEXT NOT NULL,
  payload BLOB NOT NULL,
  enqueued_at INTEGER NOT NULL,
  attempt INTEGER NOT NULL DEFAULT 1,
  available_at INTEGER NOT NULL,
  leased_until INTEGER
);
CREATE INDEX IF NOT EXISTS jobs_available ON jobs(available_at, delivery_id);
)");
}

common::Result<std::int64_t> SqliteJobQueue::enqueue(const std::string &run_id,
                                                     const std::string &payload) {
  using Out = common::Result<std::int64_t>;
  if (common::trim(run_id).empty()) {
    return Out::failure(common::ErrorKind::InvalidPayload, "run_id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Out::failure(common::ErrorKind::Storage, kNotOpen);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO jobs(run_id, payload, enqueued_at, attempt, available_at) "
                    "VALUES(?1, ?2, ?3, 1, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return Out::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, common::unix_millis());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return Out::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return Out::success(sqlite3_last_insert_rowid(db_));
}

common::Result<std::optional<Delivery>> SqliteJobQueue::receive() {
  using Out = common::Result<std::optional<Delivery>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Out::failure(common::ErrorKind::Storage, kNotOpen);
  }

  // IMMEDIATE takes the write lock up front so two consumers cannot lease the same row.
  if (const auto begin = internal::exec_sql(db_, "BEGIN IMMEDIATE;"); !begin.ok()) {
    return Out::failure(common::ErrorKind::Storage, begin.error());
  }
  const auto rollback = [this](const std::string &message) {
    (void)internal::exec_sql(db_, "ROLLBACK;");
    return Out::failure(common::ErrorKind::Storage, message);
  };

  const std::int64_t now = common::unix_millis();
  sqlite3_stmt *stmt = nullptr;
  const char *select_sql =
      "SELECT delivery_id, run_id, payload, enqueued_at, attempt FROM jobs "
      "WHERE available_at <= ?1 AND (leased_until IS NULL OR leased_until <= ?1) "
      "ORDER BY available_at ASC, delivery_id ASC LIMIT 1";
  if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return rollback(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, now);

  std::optional<Delivery> delivery;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    Delivery row;
    row.delivery_id = sqlite3_column_int64(stmt, 0);
    row.job.run_id = internal::column_text(stmt, 1);
    const auto *blob = static_cast<const char *>(sqlite3_column_blob(stmt, 2));
    if (blob != nullptr) {
      row.job.payload.assign(blob, static_cast<std::size_t>(sqlite3_column_bytes(stmt, 2)));
    }
    row.job.enqueued_at_ms = sqlite3_column_int64(stmt, 3);
    row.job.attempt = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 4));
    delivery = std::move(row);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return rollback(sqlite3_errmsg(db_));
  }

  if (delivery.has_value()) {
    sqlite3_stmt *lease = nullptr;
    if (sqlite3_prepare_v2(db_, "UPDATE jobs SET leased_until = ?2 WHERE delivery_id = ?1", -1,
                           &lease, nullptr) != SQLITE_OK) {
      return rollback(sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(lease, 1, delivery->delivery_id);
    sqlite3_bind_int64(
        lease, 2,
        now + std::chrono::duration_cast<std::chrono::milliseconds>(visibility_timeout_).count());
    const int lease_rc = sqlite3_step(lease);
    sqlite3_finalize(lease);
    if (lease_rc != SQLITE_DONE) {
      return rollback(sqlite3_errmsg(db_));
    }
  }

  if (const auto commit = internal::exec_sql(db_, "COMMIT;"); !commit.ok()) {
    return rollback(commit.error());
  }
  return Out::success(std::move(delivery));
}

common::Status SqliteJobQueue::update_one(const char *sql, const std::int64_t delivery_id,
                                          const std::int64_t value,
                                          const std::optional<std::int64_t> attempt) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Storage, kNotOpen);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, delivery_id);
  sqlite3_bind_int64(stmt, 2, value);
  if (attempt.has_value()) {
    sqlite3_bind_int64(stmt, 3, *attempt);
  }
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorKind::Storage,
                                 "unknown delivery " + std::to_string(delivery_id));
  }
  return common::Status::success();
}

common::Status SqliteJobQueue::ack(const std::int64_t delivery_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Storage, kNotOpen);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM jobs WHERE delivery_id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, delivery_id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorKind::Storage,
                                 "unknown delivery " + std::to_string(delivery_id));
  }
  return common::Status::success();
}

common::Status SqliteJobQueue::requeue(const std::int64_t delivery_id,
                                       const std::uint32_t attempt,
                                       const std::chrono::milliseconds delay) {
  return update_one(
      "UPDATE jobs SET available_at = ?2, attempt = ?3, leased_until = NULL WHERE delivery_id = ?1",
      delivery_id, common::unix_millis() + delay.count(), static_cast<std::int64_t>(attempt));
}

common::Status SqliteJobQueue::extend_lease(const std::int64_t delivery_id) {
  return update_one(
      "UPDATE jobs SET leased_until = ?2 WHERE delivery_id = ?1", delivery_id,
      common::unix_millis() +
          std::chrono::duration_cast<std::chrono::milliseconds>(visibility_timeout_).count(),
      std::nullopt);
}

common::Result<std::size_t> SqliteJobQueue::depth() {
  using Out = common::Result<std::size_t>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Out::failure(common::ErrorKind::Storage, kNotOpen);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM jobs", -1, &stmt, nullptr) != SQLITE_OK) {
    return Out::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  std::size_t count = 0;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return Out::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return Out::success(count);
}

} // namespace sandrun::queue
