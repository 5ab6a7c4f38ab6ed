#include "bibsane/domain/diagnostic_json.h"

#include "bibsane/core/version.h"

namespace bibsane::domain {

nlohmann::json diagnostic_to_json(const Diagnostic& diagnostic) {
  nlohmann::json j;
  j["severity"] = severity_to_string(diagnostic.severity);
  j["kind"] = diagnostic_kind_to_string(diagnostic.kind);
  j["message"] = diagnostic.message;
  if (diagnostic.entry_key.has_value()) {
    j["entry_key"] = diagnostic.entry_key.value();
  }
  if (diagnostic.field.has_value()) {
    j["field"] = diagnostic.field.value();
  }
  return j;
}

nlohmann::json diagnostics_to_json(const Diagnostics& diagnostics) {
  nlohmann::json j;
  j["version"] = core::kBuildVersion;
  j["failed"] = has_errors(diagnostics);

  nlohmann::json counts;
  counts["info"] = count_severity(diagnostics, DiagnosticSeverity::kInfo);
  counts["warning"] = count_severity(diagnostics, DiagnosticSeverity::kWarning);
  counts["error"] = count_severity(diagnostics, DiagnosticSeverity::kError);
  j["counts"] = counts;

  nlohmann::json items = nlohmann::json::array();
  for (const auto& diagnostic : diagnostics) {
    items.push_back(diagnostic_to_json(diagnostic));
  }
  j["diagnostics"] = items;

  return j;
}

std::string diagnostics_to_json_string(const Diagnostics& diagnostics) {
  return diagnostics_to_json(diagnostics).dump(2) + "\n";
}

}  // namespace bibsane::domain
