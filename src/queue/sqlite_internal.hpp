#pragma once

#include "sandrun/common/result.hpp"

#include <filesystem>
#include <sqlite3.h>
#include <string>

namespace sandrun::queue::internal {

[[nodiscard]] common::Status exec_sql(sqlite3 *db, const std::string &sql);

/// Opens (creating parent directories) with WAL and a busy timeout so the worker and
/// `sandrun submit` can share one database file.
[[nodiscard]] common::Result<sqlite3 *> open_database(const std::filesystem::path &path);

[[nodiscard]] std::string column_text(sqlite3_stmt *stmt, int column);

} // namespace sandrun::queue::internal
