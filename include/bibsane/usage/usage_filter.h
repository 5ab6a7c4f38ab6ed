#pragma once

#include "bibsane/domain/diagnostic.h"
#include "bibsane/domain/entry.h"

#include <set>
#include <string>
#include <vector>

namespace bibsane::usage {

struct UsageOutcome {
  std::vector<domain::Entry> entries;
  domain::Diagnostics diagnostics;
};

// filter_by_usage keeps the entries cited by the document.
//
// - entries whose key (or alias) is not cited are dropped with an info diagnostic
// - cited keys without an entry are errors
// - an entry cited only through an alias is re-keyed to that alias
// - an alias that is also the key of another entry never re-keys; citing it is an error
// - an entry cited through more than one of its keys yields one error per extra key
// - preambles always pass
//
// Matching is exact and case-sensitive. Entry order is preserved.
[[nodiscard]] UsageOutcome filter_by_usage(std::vector<domain::Entry> entries,
                                           const std::set<std::string>& used_keys);

}  // namespace bibsane::usage
