#pragma once

#include "bibsane/domain/entry.h"

#include <optional>
#include <string>
#include <vector>

namespace bibsane::emit {

// parse_year reads the whole year field as a base-10 integer; "2020a" or "n.d." give nullopt.
[[nodiscard]] std::optional<int> parse_year(const domain::Entry& entry);

// first_author_family_name returns the ASCII-folded family name of the first author, or of
// the first editor when there is no author. Empty when neither is present.
// "Doe, Jane and Roe, R." -> "doe"; "Jane {van Doe}" -> "van doe".
[[nodiscard]] std::string first_author_family_name(const domain::Entry& entry);

// sort_entries orders entries by year (missing last), first author family name, key and
// finally rendered text, so any permutation of the same entries sorts identically.
// Preambles are moved to the front in their original order.
void sort_entries(std::vector<domain::Entry>& entries,
                  const std::vector<std::string>& field_order);

}  // namespace bibsane::emit
