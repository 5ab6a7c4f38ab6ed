#include "bibsane/usage/usage_filter.h"

#include <algorithm>
#include <utility>

namespace bibsane::usage {

using domain::DiagnosticKind;

UsageOutcome filter_by_usage(std::vector<domain::Entry> entries,
                             const std::set<std::string>& used_keys) {
  UsageOutcome outcome;
  std::set<std::string> available;

  // A citation of a key that names an entry resolves to that entry, never to an alias.
  std::set<std::string> entry_keys;
  for (const auto& entry : entries) {
    if (!entry.is_preamble()) {
      entry_keys.insert(entry.key);
    }
  }

  for (auto& entry : entries) {
    if (entry.is_preamble()) {
      outcome.entries.push_back(std::move(entry));
      continue;
    }

    available.insert(entry.key);
    available.insert(entry.aliases.begin(), entry.aliases.end());

    std::vector<std::string> cited;
    if (used_keys.count(entry.key) > 0) {
      cited.push_back(entry.key);
    }
    for (const auto& alias : entry.aliases) {
      if (used_keys.count(alias) == 0) {
        continue;
      }
      if (entry_keys.count(alias) > 0) {
        outcome.diagnostics.push_back(domain::make_error(
            DiagnosticKind::kAliasCitation,
            alias + " was merged into " + entry.key + " but also names another entry",
            alias));
        continue;
      }
      cited.push_back(alias);
    }

    if (cited.empty()) {
      outcome.diagnostics.push_back(
          domain::make_info(DiagnosticKind::kUnusedEntry, "dropped unused entry", entry.key));
      continue;
    }

    if (cited.front() != entry.key) {
      const std::string previous = entry.key;
      entry.key = cited.front();
      entry.aliases.erase(std::remove(entry.aliases.begin(), entry.aliases.end(), entry.key),
                          entry.aliases.end());
      entry.aliases.push_back(previous);
      std::sort(entry.aliases.begin(), entry.aliases.end());
      outcome.diagnostics.push_back(domain::make_info(
          DiagnosticKind::kAliasCitation,
          "merged entry " + previous + " is cited as " + entry.key + ", renamed", entry.key));
    }

    for (std::size_t i = 1; i < cited.size(); ++i) {
      outcome.diagnostics.push_back(domain::make_error(
          DiagnosticKind::kAliasCitation,
          cited[i] + " is cited but was merged into " + entry.key +
              "; cite one key per entry",
          cited[i]));
    }

    outcome.entries.push_back(std::move(entry));
  }

  for (const auto& key : used_keys) {
    if (available.count(key) == 0) {
      outcome.diagnostics.push_back(
          domain::make_error(DiagnosticKind::kMissingEntry, "cited key has no entry", key));
    }
  }

  return outcome;
}

}  // namespace bibsane::usage
