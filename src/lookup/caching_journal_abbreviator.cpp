#include "bibsane/lookup/caching_journal_abbreviator.h"

namespace bibsane::lookup {

CachingJournalAbbreviator::CachingJournalAbbreviator(IJournalAbbreviator& delegate,
                                                     IAbbreviationCache& cache)
    : delegate_(delegate), cache_(cache) {}

AbbreviationResult CachingJournalAbbreviator::abbreviate(const std::string& journal) {
  if (auto cached = cache_.get(journal); cached.has_value()) {
    return AbbreviationResult::ok(cached.value());
  }

  auto result = delegate_.abbreviate(journal);
  if (result.has_value()) {
    cache_.put(journal, result.value());
  }
  return result;
}

}  // namespace bibsane::lookup
