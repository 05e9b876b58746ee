#pragma once

#include "redline/core/result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace redline::storage::sqlite {

// SqliteDb owns one SQLite connection with foreign keys enabled and applies
// the findings schema. Setup failures come back as Result errors.
class SqliteDb {
 public:
  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 before any schema is applied
  [[nodiscard]] int get_schema_version() const;

  // validation_runs + validation_errors; no-op when already at v1
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  [[nodiscard]] std::int64_t last_insert_rowid() const;
  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// PreparedStatement finalizes its statement on destruction. Bind indexes
// start at 1 and column indexes at 0, as in the SQLite C API.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  void bind_int(int index, int value);
  void bind_int64(int index, std::int64_t value);
  void bind_text(int index, const std::string& value);
  // NULL when the value is absent
  void bind_optional_int(int index, const std::optional<int>& value);
  void bind_optional_text(int index, const std::optional<std::string>& value);

  // Raw sqlite3_step result (SQLITE_ROW, SQLITE_DONE or an error code)
  [[nodiscard]] int step();

  [[nodiscard]] int column_int(int column) const;
  [[nodiscard]] std::string column_text(int column) const;
  [[nodiscard]] std::optional<int> column_optional_int(int column) const;
  [[nodiscard]] std::optional<std::string> column_optional_text(int column) const;

  // Reset statement and bindings for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace redline::storage::sqlite
