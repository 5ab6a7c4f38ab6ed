#include "sanitize.h"

#include "bibsane/config/config_loader.h"
#include "bibsane/io/citation_keys.h"
#include "bibsane/io/entry_json.h"
#include "bibsane/lookup/abbreviso_abbreviator.h"
#include "bibsane/lookup/caching_journal_abbreviator.h"
#include "bibsane/lookup/inmemory_abbreviation_cache.h"
#include "bibsane/storage/sqlite/sqlite_abbreviation_cache.h"
#include "bibsane/storage/sqlite/sqlite_db.h"

#include "sanitize_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

struct SanitizeCliConfig {
  std::vector<std::string> entry_files;
  std::optional<std::string> keys_path;
  std::optional<std::string> config_path;
  std::optional<std::string> output_path;
  std::optional<std::string> report_path;
  bool quiet{false};
  bool help{false};
};

std::vector<bibsane::apps::Option<SanitizeCliConfig>> sanitize_options() {
  return {
      {"--entries", true, "JSON entry file exported by the BibTeX parser (repeatable)",
       [](SanitizeCliConfig& c, const std::string& v) {
         c.entry_files.push_back(v);
         return true;
       }},
      {"--keys", true, "Citation key list (default: every entry counts as cited)",
       [](SanitizeCliConfig& c, const std::string& v) {
         c.keys_path = v;
         return true;
       }},
      {"--config", true, "YAML policy file",
       [](SanitizeCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--out", true, "Output .bib file (overrides the 'output' option)",
       [](SanitizeCliConfig& c, const std::string& v) {
         c.output_path = v;
         return true;
       }},
      {"--report", true, "Write a JSON diagnostics report",
       [](SanitizeCliConfig& c, const std::string& v) {
         c.report_path = v;
         return true;
       }},
      {"--quiet", false, "Only print warnings and errors",
       [](SanitizeCliConfig& c, const std::string&) {
         c.quiet = true;
         return true;
       }},
      {"--help", false, "Show this help",
       [](SanitizeCliConfig& c, const std::string&) {
         c.help = true;
         return true;
       }},
  };
}

// Announces each network lookup before delegating; cache hits stay silent.
class AnnouncingAbbreviator : public bibsane::lookup::IJournalAbbreviator {
 public:
  AnnouncingAbbreviator(std::unique_ptr<bibsane::lookup::IJournalAbbreviator> inner, bool quiet)
      : inner_(std::move(inner)), quiet_(quiet) {}

  [[nodiscard]] bibsane::lookup::AbbreviationResult abbreviate(
      const std::string& journal) override {
    if (!quiet_) {
      std::cout << "Looking up abbreviation for: " << journal << "\n";
    }
    return inner_->abbreviate(journal);
  }

 private:
  std::unique_ptr<bibsane::lookup::IJournalAbbreviator> inner_;
  bool quiet_;
};

// Owns the lookup stack used for journal abbreviation:
//   configured table -> cache -> abbreviso service
struct LookupStack {
  std::shared_ptr<bibsane::storage::sqlite::SqliteDb> db;
  std::unique_ptr<bibsane::lookup::IAbbreviationCache> cache;
  std::unique_ptr<bibsane::lookup::IJournalAbbreviator> service;
  std::unique_ptr<bibsane::lookup::ChainedJournalAbbreviator> chain;
};

bool build_lookup_stack(const bibsane::config::Config& config, bool quiet, LookupStack& stack) {
  if (config.abbreviation_cache.has_value()) {
    auto db_result = bibsane::storage::sqlite::SqliteDb::open(config.abbreviation_cache.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open abbreviation cache: " << db_result.error() << "\n";
      return false;
    }
    stack.db = db_result.value();
    auto schema_result = stack.db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return false;
    }
    stack.cache = std::make_unique<bibsane::storage::sqlite::SqliteAbbreviationCache>(stack.db);
  } else {
    stack.cache = std::make_unique<bibsane::lookup::InMemoryAbbreviationCache>();
  }

  stack.service = std::make_unique<AnnouncingAbbreviator>(
      std::make_unique<bibsane::lookup::AbbrevisoAbbreviator>(config.lookup_timeout_ms), quiet);

  std::vector<std::unique_ptr<bibsane::lookup::IJournalAbbreviator>> chain;
  chain.push_back(
      std::make_unique<bibsane::lookup::TableJournalAbbreviator>(config.journal_abbreviations));
  chain.push_back(std::make_unique<bibsane::lookup::CachingJournalAbbreviator>(*stack.service,
                                                                               *stack.cache));
  stack.chain = std::make_unique<bibsane::lookup::ChainedJournalAbbreviator>(std::move(chain));
  return true;
}

}  // namespace

int cmd_sanitize(int argc, char* argv[], int start) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = sanitize_options();
  auto parsed = bibsane::apps::parse_options(argc, argv, options, start);
  auto& cli = parsed.config;

  if (cli.help) {
    std::cout << "Usage: bibsane [sanitize] <entries.json>... [options]\n";
    bibsane::apps::print_options(std::cout, options);
    return kExitOk;
  }
  if (!parsed.valid) {
    return kExitInvalid;
  }

  cli.entry_files.insert(cli.entry_files.end(), parsed.positional.begin(),
                         parsed.positional.end());
  if (cli.entry_files.empty()) {
    std::cerr << "Error: no entry files given (see --help)\n";
    return kExitInvalid;
  }

  bibsane::config::Config config = bibsane::config::make_default_config();
  if (cli.config_path.has_value()) {
    auto loaded = bibsane::config::load_config_file(cli.config_path.value());
    if (!loaded.has_value()) {
      std::cerr << "Invalid configuration: " << loaded.error().message << "\n";
      return kExitInvalid;
    }
    config = std::move(loaded.value());
  }

  std::vector<bibsane::domain::Entry> entries;
  for (const auto& path : cli.entry_files) {
    auto read = bibsane::io::read_entries_file(path);
    if (!read.has_value()) {
      std::cerr << "Error: " << read.error() << "\n";
      return kExitInvalid;
    }
    if (!cli.quiet) {
      std::cout << "Loaded " << read.value().size() << " entries from " << path << "\n";
    }
    for (auto& entry : read.value()) {
      entries.push_back(std::move(entry));
    }
  }

  std::optional<std::set<std::string>> used_keys;
  if (cli.keys_path.has_value()) {
    auto keys = bibsane::io::read_citation_keys_file(cli.keys_path.value());
    if (!keys.has_value()) {
      std::cerr << "Error: " << keys.error() << "\n";
      return kExitInvalid;
    }
    used_keys = std::move(keys.value());
  }

  LookupStack lookup_stack;
  if (config.abbreviate_journals && !build_lookup_stack(config, cli.quiet, lookup_stack)) {
    return kExitInvalid;
  }

  SanitizeOptions run_options;
  run_options.output_path = cli.output_path.value_or(config.output);
  run_options.report_path = cli.report_path;
  run_options.quiet = cli.quiet;

  return execute_sanitize(std::move(entries), used_keys, config, lookup_stack.chain.get(),
                          run_options);
}
