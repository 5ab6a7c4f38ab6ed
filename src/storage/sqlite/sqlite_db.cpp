#include "bibsane/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace bibsane::storage::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS journal_abbreviations (
  journal TEXT PRIMARY KEY,
  abbreviation TEXT NOT NULL,
  cached_at TEXT NOT NULL
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void Statement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    const std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("Failed to open database '" + path + "': " + error);
  }

  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  sqlite3_busy_timeout(raw, kBusyTimeoutMs);
  return OpenResult::ok(std::move(db));
}

int SqliteDb::get_schema_version() const {
  Statement stmt(*this, "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid() || stmt.step() != StepResult::kRow) {
    return 0;  // Table doesn't exist yet
  }
  return stmt.column_int(0);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto begin = exec("BEGIN IMMEDIATE");
  if (!begin.has_value()) {
    return begin;
  }
  auto applied = exec(kSchemaV1);
  if (!applied.has_value()) {
    (void)exec("ROLLBACK");
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " +
                                                applied.error());
  }
  return exec("COMMIT");
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
    const std::string error = err_msg != nullptr ? err_msg : last_error();
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }
  return core::Result<bool, std::string>::ok(true);
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

Statement::Statement(const SqliteDb& db, std::string_view sql) : db_(db) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db.connection(), sql.data(), static_cast<int>(sql.size()), &raw,
                         nullptr) != SQLITE_OK) {
    error_ = db.last_error();
    return;
  }
  stmt_.reset(raw);
}

bool Statement::bind_text(int index, const std::string& value) {
  if (!stmt_) {
    return false;
  }
  if (sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    error_ = db_.last_error();
    return false;
  }
  return true;
}

StepResult Statement::step() {
  if (!stmt_) {
    return StepResult::kError;
  }
  switch (sqlite3_step(stmt_.get())) {
    case SQLITE_ROW:
      return StepResult::kRow;
    case SQLITE_DONE:
      return StepResult::kDone;
    default:
      error_ = db_.last_error();
      return StepResult::kError;
  }
}

int Statement::column_int(int column) const {
  return sqlite3_column_int(stmt_.get(), column);
}

std::string Statement::column_text(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), column);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column)));
}

}  // namespace bibsane::storage::sqlite
