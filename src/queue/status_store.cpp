#include "sandrun/queue/status_store.hpp"

#include "sandrun/common/fs.hpp"
#include "sandrun/common/json_util.hpp"
#include "sqlite_internal.hpp"

#include <sstream>

namespace sandrun::queue {

std::string run_state_to_string(const RunState state) {
  switch (state) {
  case RunState::Running:
    return "running";
  case RunState::Succeeded:
    return "succeeded";
  case RunState::Failed:
    return "failed";
  case RunState::PermanentlyFailed:
    return "permanently_failed";
  }
  return "running";
}

std::optional<RunState> run_state_from_string(const std::string &value) {
  if (value == "running") {
    return RunState::Running;
  }
  if (value == "succeeded") {
    return RunState::Succeeded;
  }
  if (value == "failed") {
    return RunState::Failed;
  }
  if (value == "permanently_failed") {
    return RunState::PermanentlyFailed;
  }
  return std::nullopt;
}

std::string RunStatusRecord::to_json() const {
  std::ostringstream json;
  json << "{\"run_id\":\"" << common::json_escape(run_id) << "\",";
  json << "\"state\":\"" << run_state_to_string(state) << "\",";
  json << "\"attempt\":" << attempt << ",";
  json << "\"updated_at_ms\":" << updated_at_ms << ",";
  // Succeeded runs carry the result object; everything else a reason string.
  json << "\"result_or_reason\":";
  if (state == RunState::Succeeded && common::json_is_object(detail)) {
    json << detail;
  } else {
    json << "\"" << common::json_escape(detail) << "\"";
  }
  json << "}";
  return json.str();
}

SqliteStatusStore::SqliteStatusStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {}

SqliteStatusStore::~SqliteStatusStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteStatusStore::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }
  auto opened = internal::open_database(db_path_);
  if (!opened.ok()) {
    return opened.status();
  }
  db_ = opened.value();
  return internal::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS run_status (
  run_id TEXT PRIMARY KEY,
  state TEXT NOT NULL,
  detail TEXT NOT NULL DEFAULT '',
  attempt INTEGER NOT NULL DEFAULT 1,
  updated_at INTEGER NOT NULL
);
)");
}

common::Status SqliteStatusStore::report(const RunStatusRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::Storage, "status store is not open");
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO run_status(run_id, state, detail, attempt, updated_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  const std::string state = run_state_to_string(record.state);
  sqlite3_bind_text(stmt, 1, record.run_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, state.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.detail.c_str(), static_cast<int>(record.detail.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, record.attempt);
  sqlite3_bind_int64(stmt, 5,
                     record.updated_at_ms == 0 ? common::unix_millis() : record.updated_at_ms);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::optional<RunStatusRecord>> SqliteStatusStore::get(const std::string &run_id) {
  using Out = common::Result<std::optional<RunStatusRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Out::failure(common::ErrorKind::Storage, "status store is not open");
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT run_id, state, detail, attempt, updated_at FROM run_status "
                         "WHERE run_id = ?1",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return Out::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<RunStatusRecord> record;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    RunStatusRecord row;
    row.run_id = internal::column_text(stmt, 0);
    const auto state = run_state_from_string(internal::column_text(stmt, 1));
    if (!state.has_value()) {
      sqlite3_finalize(stmt);
      return Out::failure(common::ErrorKind::Storage,
                          "unknown run state stored for " + run_id);
    }
    row.state = *state;
    row.detail = internal::column_text(stmt, 2);
    row.attempt = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 3));
    row.updated_at_ms = sqlite3_column_int64(stmt, 4);
    record = std::move(row);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return Out::failure(common::ErrorKind::Storage, sqlite3_errmsg(db_));
  }
  return Out::success(std::move(record));
}

} // namespace sandrun::queue
