#pragma once

#include "bibsane/core/result.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace bibsane::lookup {

/// Error type for abbreviation lookup failures (network, unknown journal, bad reply)
struct LookupError {
  std::string message;
};

using AbbreviationResult = core::Result<std::string, LookupError>;

/// Journal abbreviation service: full journal name -> abbreviated form.
/// Implementations may block for a bounded time; callers never retry.
class IJournalAbbreviator {
 public:
  virtual ~IJournalAbbreviator() = default;

  [[nodiscard]] virtual AbbreviationResult abbreviate(const std::string& journal) = 0;
};

/// Fixed-table abbreviator (configured journal_abbreviations, tests)
class TableJournalAbbreviator : public IJournalAbbreviator {
 public:
  explicit TableJournalAbbreviator(std::map<std::string, std::string> table);

  [[nodiscard]] AbbreviationResult abbreviate(const std::string& journal) override;

 private:
  std::map<std::string, std::string> table_;
};

/// Tries each abbreviator in order and returns the first success.
/// Fails with the last error when every delegate fails.
class ChainedJournalAbbreviator : public IJournalAbbreviator {
 public:
  explicit ChainedJournalAbbreviator(std::vector<std::unique_ptr<IJournalAbbreviator>> chain);

  [[nodiscard]] AbbreviationResult abbreviate(const std::string& journal) override;

 private:
  std::vector<std::unique_ptr<IJournalAbbreviator>> chain_;
};

}  // namespace bibsane::lookup
