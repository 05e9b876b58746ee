#include "redline/sink/sqlite_result_sink.h"

#include <sqlite3.h>

#include <stdexcept>

namespace redline::sink {

using storage::sqlite::PreparedStatement;

namespace {

constexpr const char* kInsertFinding = R"(
  INSERT INTO validation_errors
    (run_id, idx, file_name, validator_name, message, sentence, line_number,
     start_position, end_position)
  VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

}  // namespace

SqliteResultSink::SqliteResultSink(std::shared_ptr<storage::sqlite::SqliteDb> db,
                                   std::ostream& log)
    : db_(std::move(db)), log_(log) {
  if (!db_) {
    throw std::invalid_argument("SqliteResultSink requires a database");
  }
}

SqliteResultSink::~SqliteResultSink() = default;

void SqliteResultSink::flush_header() {
  run_id_.reset();
  header_error_.clear();
  next_idx_ = 0;

  PreparedStatement stmt(db_->connection(),
                         "INSERT INTO validation_runs (started_at) VALUES (datetime('now'))");
  if (!stmt.is_valid()) {
    header_error_ = "cannot open validation run: " + stmt.error();
    return;
  }
  if (stmt.step() != SQLITE_DONE) {
    header_error_ = "cannot open validation run: " + db_->last_error();
    return;
  }
  run_id_ = db_->last_insert_rowid();

  if (!insert_stmt_) {
    insert_stmt_ = std::make_unique<PreparedStatement>(db_->connection(), kInsertFinding);
  }
}

void SqliteResultSink::flush_footer() {
  if (!run_id_) {
    return;
  }

  PreparedStatement stmt(db_->connection(),
                         "UPDATE validation_runs SET finished_at = datetime('now'), error_count = ?"
                         " WHERE run_id = ?");
  if (!stmt.is_valid()) {
    log_ << "Failed to close validation run " << *run_id_ << ": " << stmt.error() << "\n";
    return;
  }
  stmt.bind_int(1, next_idx_);
  stmt.bind_int64(2, *run_id_);
  if (stmt.step() != SQLITE_DONE) {
    log_ << "Failed to close validation run " << *run_id_ << ": " << db_->last_error() << "\n";
  }
}

SinkResult SqliteResultSink::flush_error(const domain::Document& document,
                                         const validator::ValidationError& error) {
  if (!run_id_) {
    return SinkResult::err(
        SinkError{header_error_.empty() ? "no validation run is open" : header_error_});
  }
  if (!insert_stmt_->is_valid()) {
    return SinkResult::err(SinkError{insert_stmt_->error()});
  }

  auto& stmt = *insert_stmt_;
  stmt.reset();
  stmt.bind_int64(1, *run_id_);
  stmt.bind_int(2, next_idx_);
  stmt.bind_optional_text(3, document.file_name);
  stmt.bind_text(4, error.validator_name);
  stmt.bind_text(5, error.message);
  stmt.bind_text(6, error.sentence);
  stmt.bind_int(7, error.line_number);
  stmt.bind_optional_int(8, error.start_position);
  stmt.bind_optional_int(9, error.end_position);

  if (stmt.step() != SQLITE_DONE) {
    return SinkResult::err(SinkError{db_->last_error()});
  }

  ++next_idx_;
  return SinkResult::ok(true);
}

std::vector<PersistedFinding> SqliteResultSink::query_run(std::int64_t run_id) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT file_name, validator_name, message, sentence, line_number,"
                         "       start_position, end_position"
                         "  FROM validation_errors WHERE run_id = ? ORDER BY idx");
  if (!stmt.is_valid()) {
    return {};
  }
  stmt.bind_int64(1, run_id);

  std::vector<PersistedFinding> result;
  while (stmt.step() == SQLITE_ROW) {
    PersistedFinding finding;
    finding.file_name = stmt.column_optional_text(0);
    finding.error.validator_name = stmt.column_text(1);
    finding.error.message = stmt.column_text(2);
    finding.error.sentence = stmt.column_text(3);
    finding.error.line_number = stmt.column_int(4);
    finding.error.start_position = stmt.column_optional_int(5);
    finding.error.end_position = stmt.column_optional_int(6);
    result.push_back(std::move(finding));
  }

  return result;
}

}  // namespace redline::sink
