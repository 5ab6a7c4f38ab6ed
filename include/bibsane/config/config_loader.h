#pragma once

#include "bibsane/config/config.h"
#include "bibsane/core/result.h"

#include <string>

namespace bibsane::config {

/// Error type for configuration loading failures
struct ConfigError {
  std::string message;
};

using ConfigResult = core::Result<Config, ConfigError>;

/// Map a YAML policy document onto Config.
///
/// Recognized top-level options:
///   allowed_types, cruft, required, brace_exceptions, marker_field, merge_on_doi,
///   merge_on_key, allow_preamble, normalize_whitespace, normalize_doi, normalize_pages,
///   abbreviate_journals, sort, field_order, journal_abbreviations, abbreviation_cache,
///   lookup_timeout_ms, output
///
/// Rules (cruft, required) are sequences of maps with keys `type` ("*" or a type name),
/// optional `policy` and `fields`. Options absent from the document keep their defaults.
/// An empty document yields the default configuration.
[[nodiscard]] ConfigResult load_config_yaml(const std::string& text);

/// Read and map a YAML policy file
[[nodiscard]] ConfigResult load_config_file(const std::string& path);

}  // namespace bibsane::config
