#pragma once

#include "bibsane/core/result.h"
#include "bibsane/domain/entry.h"

#include <string>
#include <vector>

namespace bibsane::io {

using EntriesResult = core::Result<std::vector<domain::Entry>, std::string>;

/// Read entries from the JSON export of a BibTeX parser.
///
/// Accepted layouts:
///   [ {"ENTRYTYPE": "article", "ID": "Doe20", "author": "...", ...}, ... ]
///   {"entries": [ ... ], "preambles": ["\\newcommand..."]}
///
/// Every other member of an entry object is a field; member order is field order and names
/// are lowercased. Field values must be strings. A preamble object
/// ({"ENTRYTYPE": "preamble", "preamble": "..."}) or a "preambles" item becomes an entry
/// keyed "@preamble-N".
[[nodiscard]] EntriesResult read_entries_json(const std::string& text);

/// Read and parse a JSON entry file
[[nodiscard]] EntriesResult read_entries_file(const std::string& path);

}  // namespace bibsane::io
