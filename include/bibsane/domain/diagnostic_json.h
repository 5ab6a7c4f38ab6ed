#pragma once

#include "bibsane/domain/diagnostic.h"

#include <nlohmann/json.hpp>

#include <string>

namespace bibsane::domain {

/// Serialize one diagnostic; absent entry_key/field are omitted
[[nodiscard]] nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic);

/// Serialize a run report: failure flag, per-severity counts and diagnostics in order
[[nodiscard]] nlohmann::json diagnostics_to_json(const Diagnostics& diagnostics);

/// Serialize a run report to an indented JSON string with a trailing newline
[[nodiscard]] std::string diagnostics_to_json_string(const Diagnostics& diagnostics);

}  // namespace bibsane::domain
