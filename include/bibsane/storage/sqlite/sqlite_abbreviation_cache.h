#pragma once

#include "bibsane/lookup/abbreviation_cache.h"
#include "bibsane/storage/sqlite/sqlite_db.h"

#include <memory>

namespace bibsane::storage::sqlite {

// SQLite-backed abbreviation cache.
// Persists lookups across runs so the network service is asked once per journal.
// Requires a database with schema v1 applied (see SqliteDb::ensure_schema_v1).
class SqliteAbbreviationCache final : public lookup::IAbbreviationCache {
 public:
  explicit SqliteAbbreviationCache(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] std::optional<std::string> get(const std::string& journal) const override;
  void put(const std::string& journal, const std::string& abbreviation) override;
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace bibsane::storage::sqlite
