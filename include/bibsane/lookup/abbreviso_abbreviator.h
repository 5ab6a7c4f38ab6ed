#pragma once

#include "bibsane/lookup/journal_abbreviator.h"

#include <string>

namespace bibsane::lookup {

// Asks the abbreviso web service for the ISO 4 abbreviation of a journal name.
// One blocking HTTP GET per call, bounded by timeout_ms. Transport failures,
// HTTP errors and empty replies all come back as LookupError.
class AbbrevisoAbbreviator : public IJournalAbbreviator {
 public:
  static constexpr const char* kDefaultBaseUrl = "https://abbreviso.toolforge.org/abbreviso/a/";

  explicit AbbrevisoAbbreviator(long timeout_ms, std::string base_url = kDefaultBaseUrl);

  [[nodiscard]] AbbreviationResult abbreviate(const std::string& journal) override;

 private:
  long timeout_ms_;
  std::string base_url_;
};

}  // namespace bibsane::lookup
