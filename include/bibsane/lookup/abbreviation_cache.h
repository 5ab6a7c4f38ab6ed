#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bibsane::lookup {

/// Interface for persisted journal-name -> abbreviation pairs
class IAbbreviationCache {
 public:
  virtual ~IAbbreviationCache() = default;

  /// Cached abbreviation for a journal name, nullopt on miss
  [[nodiscard]] virtual std::optional<std::string> get(const std::string& journal) const = 0;

  /// Store or replace an abbreviation
  virtual void put(const std::string& journal, const std::string& abbreviation) = 0;

  /// All cached pairs, sorted by journal name for determinism
  [[nodiscard]] virtual std::vector<std::pair<std::string, std::string>> list_all() const = 0;
};

}  // namespace bibsane::lookup
