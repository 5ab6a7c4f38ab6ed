#pragma once

#include "bibsane/lookup/abbreviation_cache.h"
#include "bibsane/lookup/journal_abbreviator.h"

namespace bibsane::lookup {

// CachingJournalAbbreviator answers from the cache and only asks the delegate on a miss.
// Successful delegate answers are stored; failures are not, so the next run asks again.
// Both collaborators are borrowed and must outlive this object.
class CachingJournalAbbreviator : public IJournalAbbreviator {
 public:
  CachingJournalAbbreviator(IJournalAbbreviator& delegate, IAbbreviationCache& cache);

  [[nodiscard]] AbbreviationResult abbreviate(const std::string& journal) override;

 private:
  IJournalAbbreviator& delegate_;
  IAbbreviationCache& cache_;
};

}  // namespace bibsane::lookup
