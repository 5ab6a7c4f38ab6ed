#include "cache_list.h"

#include "bibsane/storage/sqlite/sqlite_abbreviation_cache.h"
#include "bibsane/storage/sqlite/sqlite_db.h"

#include "shared/arg_parser.h"
#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CacheListCliConfig {
  std::optional<std::string> cache_path;
  bool json{false};
};

}  // namespace

int cmd_cache_list(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<bibsane::apps::Option<CacheListCliConfig>> options = {
      {"--cache", true, "Path to the SQLite abbreviation cache",
       [](CacheListCliConfig& c, const std::string& v) {
         c.cache_path = v;
         return true;
       }},
      {"--json", false, "Print a JSON object instead of a table",
       [](CacheListCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = bibsane::apps::parse_options(argc, argv, options, 2);
  if (!parsed.valid) {
    return 1;
  }
  if (!parsed.config.cache_path.has_value()) {
    std::cerr << "Error: --cache <path> is required\n";
    return 1;
  }

  auto db_result = bibsane::storage::sqlite::SqliteDb::open(parsed.config.cache_path.value());
  if (!db_result.has_value()) {
    std::cerr << "Failed to open database: " << db_result.error() << "\n";
    return 1;
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema_v1();
  if (!schema_result.has_value()) {
    std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
    return 1;
  }

  const bibsane::storage::sqlite::SqliteAbbreviationCache cache(db);
  const auto pairs = cache.list_all();

  if (parsed.config.json) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& [journal, abbreviation] : pairs) {
      out[journal] = abbreviation;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  for (const auto& [journal, abbreviation] : pairs) {
    std::cout << journal << " -> " << abbreviation << "\n";
  }
  std::cout << pairs.size() << " cached abbreviation(s)\n";
  return 0;
}
