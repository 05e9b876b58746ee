#include "redline/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace redline::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

constexpr const char* kSchemaV1 = R"(
PRAGMA foreign_keys = ON;

CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS validation_runs (
  run_id INTEGER PRIMARY KEY AUTOINCREMENT,
  started_at TEXT NOT NULL,
  finished_at TEXT,
  error_count INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS validation_errors (
  run_id INTEGER NOT NULL,
  idx INTEGER NOT NULL,
  file_name TEXT,
  validator_name TEXT NOT NULL,
  message TEXT NOT NULL,
  sentence TEXT NOT NULL,
  line_number INTEGER NOT NULL,
  start_position INTEGER,
  end_position INTEGER,
  PRIMARY KEY(run_id, idx),
  FOREIGN KEY(run_id) REFERENCES validation_runs(run_id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_validation_errors_validator
  ON validation_errors(validator_name);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return OpenResult::err("Failed to open database: " + error);
  }

  char* err_msg = nullptr;
  rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    sqlite3_close(db);
    return OpenResult::err("Failed to enable foreign keys: " + error);
  }

  return OpenResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // no schema_version table yet
  }
  return stmt.step() == SQLITE_ROW ? stmt.column_int(0) : 0;
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto applied = exec(kSchemaV1);
  if (!applied.has_value()) {
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + applied.error());
  }
  return applied;
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err(error);
  }
  return core::Result<bool, std::string>::ok(true);
}

std::int64_t SqliteDb::last_insert_rowid() const { return sqlite3_last_insert_rowid(db_.get()); }

std::string SqliteDb::last_error() const { return sqlite3_errmsg(db_.get()); }

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_int(int index, int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

void PreparedStatement::bind_int64(int index, std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, value);
}

void PreparedStatement::bind_text(int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_optional_int(int index, const std::optional<int>& value) {
  if (value) {
    bind_int(index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

void PreparedStatement::bind_optional_text(int index, const std::optional<std::string>& value) {
  if (value) {
    bind_text(index, *value);
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

int PreparedStatement::step() { return sqlite3_step(stmt_.get()); }

int PreparedStatement::column_int(int column) const {
  return sqlite3_column_int(stmt_.get(), column);
}

std::string PreparedStatement::column_text(int column) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), column);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string{};  // NOLINT
}

std::optional<int> PreparedStatement::column_optional_int(int column) const {
  if (sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_int(column);
}

std::optional<std::string> PreparedStatement::column_optional_text(int column) const {
  if (sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(column);
}

void PreparedStatement::reset() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

}  // namespace redline::storage::sqlite
