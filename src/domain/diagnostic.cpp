#include "bibsane/domain/diagnostic.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace bibsane::domain {

std::string severity_to_string(const DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::kInfo:
      return "info";
    case DiagnosticSeverity::kWarning:
      return "warning";
    case DiagnosticSeverity::kError:
      return "error";
  }
  return "unknown";
}

std::string diagnostic_kind_to_string(const DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::kParseHazard:
      return "parse-hazard";
    case DiagnosticKind::kPolicyViolation:
      return "policy-violation";
    case DiagnosticKind::kPolicyDrop:
      return "policy-drop";
    case DiagnosticKind::kUnrecognizedType:
      return "unrecognized-type";
    case DiagnosticKind::kFieldRemoved:
      return "field-removed";
    case DiagnosticKind::kMissingField:
      return "missing-field";
    case DiagnosticKind::kInvalidDoi:
      return "invalid-doi";
    case DiagnosticKind::kIrregularPages:
      return "irregular-pages";
    case DiagnosticKind::kLookupDegradation:
      return "lookup-degradation";
    case DiagnosticKind::kMerged:
      return "merged";
    case DiagnosticKind::kMergeConflict:
      return "merge-conflict";
    case DiagnosticKind::kDuplicateKey:
      return "duplicate-key";
    case DiagnosticKind::kDuplicateDoi:
      return "duplicate-doi";
    case DiagnosticKind::kKeyCollision:
      return "key-collision";
    case DiagnosticKind::kUnusedEntry:
      return "unused-entry";
    case DiagnosticKind::kMissingEntry:
      return "missing-entry";
    case DiagnosticKind::kAliasCitation:
      return "alias-citation";
  }
  return "unknown";
}

namespace {

Diagnostic make(const DiagnosticKind kind, const DiagnosticSeverity severity,
                std::string message, std::optional<std::string> entry_key,
                std::optional<std::string> field) {
  return Diagnostic{kind, severity, std::move(message), std::move(entry_key), std::move(field)};
}

}  // namespace

Diagnostic make_info(const DiagnosticKind kind, std::string message,
                     std::optional<std::string> entry_key, std::optional<std::string> field) {
  return make(kind, DiagnosticSeverity::kInfo, std::move(message), std::move(entry_key),
              std::move(field));
}

Diagnostic make_warning(const DiagnosticKind kind, std::string message,
                        std::optional<std::string> entry_key, std::optional<std::string> field) {
  return make(kind, DiagnosticSeverity::kWarning, std::move(message), std::move(entry_key),
              std::move(field));
}

Diagnostic make_error(const DiagnosticKind kind, std::string message,
                      std::optional<std::string> entry_key, std::optional<std::string> field) {
  return make(kind, DiagnosticSeverity::kError, std::move(message), std::move(entry_key),
              std::move(field));
}

bool has_errors(const Diagnostics& diagnostics) {
  return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& d) {
    return d.severity == DiagnosticSeverity::kError;
  });
}

std::size_t count_severity(const Diagnostics& diagnostics, const DiagnosticSeverity severity) {
  return static_cast<std::size_t>(
      std::count_if(diagnostics.begin(), diagnostics.end(),
                    [severity](const Diagnostic& d) { return d.severity == severity; }));
}

std::size_t count_kind(const Diagnostics& diagnostics, const DiagnosticKind kind) {
  return static_cast<std::size_t>(
      std::count_if(diagnostics.begin(), diagnostics.end(),
                    [kind](const Diagnostic& d) { return d.kind == kind; }));
}

std::string format_diagnostic(const Diagnostic& diagnostic) {
  std::string line = severity_to_string(diagnostic.severity);
  line += " [";
  line += diagnostic_kind_to_string(diagnostic.kind);
  line += "] ";
  if (diagnostic.entry_key.has_value()) {
    line += diagnostic.entry_key.value();
    if (diagnostic.field.has_value()) {
      line += "." + diagnostic.field.value();
    }
    line += ": ";
  } else if (diagnostic.field.has_value()) {
    line += diagnostic.field.value() + ": ";
  }
  line += diagnostic.message;
  return line;
}

void append(Diagnostics& to, Diagnostics&& from) {
  to.insert(to.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
  from.clear();
}

}  // namespace bibsane::domain
