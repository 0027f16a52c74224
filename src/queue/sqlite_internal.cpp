#include "sqlite_internal.hpp"

namespace sandrun::queue::internal {

namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::Storage, message);
  }
  return common::Status::success();
}

common::Result<sqlite3 *> open_database(const std::filesystem::path &path) {
  using Out = common::Result<sqlite3 *>;
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Out::failure(common::ErrorKind::Storage,
                          "failed to create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return Out::failure(common::ErrorKind::Storage, path.string() + ": " + message);
  }
  sqlite3_busy_timeout(db, kBusyTimeoutMs);
  if (const auto wal = exec_sql(db, "PRAGMA journal_mode=WAL;"); !wal.ok()) {
    sqlite3_close(db);
    return Out::failure(common::ErrorKind::Storage, wal.error());
  }
  return Out::success(db);
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  if (text == nullptr) {
    return "";
  }
  return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

} // namespace sandrun::queue::internal
