#include "bibsane/lookup/journal_abbreviator.h"

#include <utility>

namespace bibsane::lookup {

TableJournalAbbreviator::TableJournalAbbreviator(std::map<std::string, std::string> table)
    : table_(std::move(table)) {}

AbbreviationResult TableJournalAbbreviator::abbreviate(const std::string& journal) {
  auto it = table_.find(journal);
  if (it == table_.end()) {
    return AbbreviationResult::err(LookupError{"no abbreviation known for: " + journal});
  }
  return AbbreviationResult::ok(it->second);
}

ChainedJournalAbbreviator::ChainedJournalAbbreviator(
    std::vector<std::unique_ptr<IJournalAbbreviator>> chain)
    : chain_(std::move(chain)) {}

AbbreviationResult ChainedJournalAbbreviator::abbreviate(const std::string& journal) {
  LookupError last_error{"no abbreviation service configured"};
  for (const auto& abbreviator : chain_) {
    if (!abbreviator) {
      continue;
    }
    auto result = abbreviator->abbreviate(journal);
    if (result.has_value()) {
      return result;
    }
    last_error = result.error();
  }
  return AbbreviationResult::err(last_error);
}

}  // namespace bibsane::lookup
