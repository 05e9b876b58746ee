#pragma once

#include "redline/sink/result_sink.h"
#include "redline/storage/sqlite/sqlite_db.h"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace redline::sink {

// A finding as read back from the database. The document pointer of error is
// always null; file_name carries the document identity instead.
struct PersistedFinding {
  std::optional<std::string> file_name;
  validator::ValidationError error;
};

// SqliteResultSink persists findings into validation_errors.
//
// Each flush_header opens a new validation_runs row; findings of that run are
// numbered by an idx column in arrival order, and flush_footer records the
// finish time and count. The caller applies the schema (ensure_schema_v1)
// before constructing the sink.
class SqliteResultSink final : public IResultSink {
 public:
  // log receives failures that have no result to travel in (closing a run).
  explicit SqliteResultSink(std::shared_ptr<storage::sqlite::SqliteDb> db,
                            std::ostream& log = std::cerr);
  ~SqliteResultSink() override;

  SqliteResultSink(const SqliteResultSink&) = delete;
  SqliteResultSink& operator=(const SqliteResultSink&) = delete;

  void flush_header() override;
  void flush_footer() override;
  [[nodiscard]] SinkResult flush_error(const domain::Document& document,
                                       const validator::ValidationError& error) override;

  // Run opened by the most recent flush_header, if it could be recorded
  [[nodiscard]] std::optional<std::int64_t> current_run() const noexcept { return run_id_; }

  // Findings of a run in the order they were flushed
  [[nodiscard]] std::vector<PersistedFinding> query_run(std::int64_t run_id) const;

 private:
  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::ostream& log_;
  // Prepared on the first flush_header and reused for every finding
  std::unique_ptr<storage::sqlite::PreparedStatement> insert_stmt_;
  std::optional<std::int64_t> run_id_;
  std::string header_error_;
  int next_idx_{0};
};

}  // namespace redline::sink
