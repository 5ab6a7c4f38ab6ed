#pragma once

#include "bibsane/core/result.h"

#include <set>
#include <string>

namespace bibsane::io {

/// Parse a citation key list: keys separated by commas or whitespace, any number per line.
/// '#' starts a comment running to the end of the line.
[[nodiscard]] std::set<std::string> parse_citation_keys(const std::string& text);

/// Read and parse a citation key file
[[nodiscard]] core::Result<std::set<std::string>, std::string> read_citation_keys_file(
    const std::string& path);

}  // namespace bibsane::io
