#include "bibsane/storage/sqlite/sqlite_abbreviation_cache.h"

#include <iostream>

namespace bibsane::storage::sqlite {

SqliteAbbreviationCache::SqliteAbbreviationCache(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

std::optional<std::string> SqliteAbbreviationCache::get(const std::string& journal) const {
  Statement stmt(*db_, "SELECT abbreviation FROM journal_abbreviations WHERE journal = ?");
  if (!stmt.bind_text(1, journal) || stmt.step() != StepResult::kRow) {
    return std::nullopt;
  }
  return stmt.column_text(0);
}

void SqliteAbbreviationCache::put(const std::string& journal, const std::string& abbreviation) {
  Statement stmt(*db_, R"(
    INSERT INTO journal_abbreviations (journal, abbreviation, cached_at)
    VALUES (?, ?, datetime('now'))
    ON CONFLICT(journal) DO UPDATE SET
      abbreviation = excluded.abbreviation,
      cached_at = excluded.cached_at
  )");

  // A failed write only costs a repeated lookup on the next run
  if (!stmt.bind_text(1, journal) || !stmt.bind_text(2, abbreviation) ||
      stmt.step() != StepResult::kDone) {
    std::cerr << "Warning: failed to cache abbreviation for '" << journal
              << "': " << stmt.error() << "\n";
  }
}

std::vector<std::pair<std::string, std::string>> SqliteAbbreviationCache::list_all() const {
  Statement stmt(*db_, "SELECT journal, abbreviation FROM journal_abbreviations ORDER BY journal");

  std::vector<std::pair<std::string, std::string>> pairs;
  while (stmt.step() == StepResult::kRow) {
    pairs.emplace_back(stmt.column_text(0), stmt.column_text(1));
  }
  return pairs;
}

}  // namespace bibsane::storage::sqlite
