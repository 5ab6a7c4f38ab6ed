#pragma once

#include "bibsane/lookup/abbreviation_cache.h"

#include <map>

namespace bibsane::lookup {

// InMemoryAbbreviationCache stores abbreviations in a std::map.
// std::map guarantees deterministic iteration order (sorted by journal name).
// Used when no abbreviation_cache path is configured, and in tests.
class InMemoryAbbreviationCache final : public IAbbreviationCache {
 public:
  [[nodiscard]] std::optional<std::string> get(const std::string& journal) const override;
  void put(const std::string& journal, const std::string& abbreviation) override;
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> list_all() const override;

 private:
  std::map<std::string, std::string> entries_;
};

}  // namespace bibsane::lookup
