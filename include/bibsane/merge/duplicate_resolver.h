#pragma once

#include "bibsane/config/config.h"
#include "bibsane/domain/diagnostic.h"
#include "bibsane/domain/entry.h"

#include <string>
#include <variant>
#include <vector>

namespace bibsane::merge {

struct MergeOutcome {
  std::vector<domain::Entry> entries;
  domain::Diagnostics diagnostics;
};

// FieldConflict names one field on which the members of a merge group disagree.
// "type" is used when the entry types differ.
struct FieldConflict {
  std::string field;
  std::vector<std::string> values;  // distinct values in encounter order
};

// merge_group combines entries that describe the same work.
// Succeeds only if all members have the same type and every field present in more than one
// member carries the same value (DOIs compare by doi_merge_key). The result is keyed by the
// shortest citation key (ties: lexicographically smallest); every other key becomes an alias.
// Members are visited in that key order, then by content, so the product does not depend on
// the order of `members`. Fields follow the first member's order, then fields only the
// others have.
[[nodiscard]] std::variant<domain::Entry, std::vector<FieldConflict>> merge_group(
    const std::vector<const domain::Entry*>& members);

// DuplicateResolver finds entries describing the same work and merges or flags them.
//
// Passes over the entry list, in order:
//   1. DOI groups: merge or report a merge conflict (merge_on_doi), or report a duplicate
//      DOI (fail_on_duplicate_doi)
//   2. identical-key groups: merge (merge_on_key) or report a duplicate key
//   3. keys and aliases of different entries: a key that is also another entry's alias is a
//      duplicate key; keys equal up to letter case give one key collision per pair
//
// A merged entry takes the position of its first member. Preambles are passed through.
class DuplicateResolver {
 public:
  explicit DuplicateResolver(const config::Config& config);

  [[nodiscard]] MergeOutcome resolve_duplicates(std::vector<domain::Entry> entries) const;

 private:
  const config::Config& config_;
};

}  // namespace bibsane::merge
