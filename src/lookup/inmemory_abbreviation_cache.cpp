#include "bibsane/lookup/inmemory_abbreviation_cache.h"

namespace bibsane::lookup {

std::optional<std::string> InMemoryAbbreviationCache::get(const std::string& journal) const {
  auto it = entries_.find(journal);
  if (it != entries_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void InMemoryAbbreviationCache::put(const std::string& journal, const std::string& abbreviation) {
  entries_[journal] = abbreviation;
}

std::vector<std::pair<std::string, std::string>> InMemoryAbbreviationCache::list_all() const {
  return {entries_.begin(), entries_.end()};
}

}  // namespace bibsane::lookup
