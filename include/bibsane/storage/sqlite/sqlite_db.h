#pragma once

#include "bibsane/core/result.h"

#include <memory>
#include <string>
#include <string_view>

// SQLite handles stay opaque outside sqlite_db.cpp
struct sqlite3;
struct sqlite3_stmt;

namespace bibsane::storage::sqlite {

// SqliteDb owns one SQLite connection and the schema version of the cache database.
// Several builds may share one cache file, so connections wait (busy timeout) instead of
// failing on a locked database.
class SqliteDb {
 public:
  // Open or create the database at path; ":memory:" gives a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied yet
  [[nodiscard]] int get_schema_version() const;

  // Create the journal abbreviation tables (schema v1) inside one transaction.
  // No-op when the database is already at v1 or later.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Message of the most recent failed call on this connection
  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

enum class StepResult {
  kRow,
  kDone,
  kError,
};

// Statement is a prepared statement with text binding and column access.
// Parameters and columns are 1-based and 0-based respectively, as in the SQLite API.
class Statement {
 public:
  Statement(const SqliteDb& db, std::string_view sql);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  // Binds a copy of value to parameter `index`; returns false if the bind failed.
  bool bind_text(int index, const std::string& value);

  [[nodiscard]] StepResult step();

  [[nodiscard]] int column_int(int column) const;

  // Text of `column` in the current row; empty for NULL.
  [[nodiscard]] std::string column_text(int column) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  const SqliteDb& db_;
  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace bibsane::storage::sqlite
