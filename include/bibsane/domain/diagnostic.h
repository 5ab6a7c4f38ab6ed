#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bibsane::domain {

enum class DiagnosticSeverity {
  kInfo,
  kWarning,
  kError,
};

// DiagnosticKind tags every observation with its place in the error taxonomy.
// The string form (diagnostic_kind_to_string) is stable and used in reports.
enum class DiagnosticKind {
  kParseHazard,         // unbalanced braces in a field value
  kPolicyViolation,     // disallowed preamble, unrecognized type under an allow-set
  kPolicyDrop,          // recognized type outside the allow-set
  kUnrecognizedType,    // unknown type kept because no allow-set is configured
  kFieldRemoved,        // cruft field stripped by a rule
  kMissingField,        // required field absent
  kInvalidDoi,          // DOI without 10. prefix after normalization
  kIrregularPages,      // page range that cannot be canonicalized
  kLookupDegradation,   // journal abbreviation lookup failed
  kMerged,              // duplicate entries combined
  kMergeConflict,       // duplicate entries disagree on a field
  kDuplicateKey,        // identical keys with key merging disabled
  kDuplicateDoi,        // shared DOI with duplicate_doi: fail
  kKeyCollision,        // keys differing only by letter case
  kUnusedEntry,         // entry not cited by the document
  kMissingEntry,        // citation without an entry
  kAliasCitation,       // citation of a key merged into another entry
};

// Diagnostic is purely observational output of a pass; it never mutates entries.
struct Diagnostic {
  DiagnosticKind kind{DiagnosticKind::kParseHazard};
  DiagnosticSeverity severity{DiagnosticSeverity::kInfo};
  std::string message;
  std::optional<std::string> entry_key;
  std::optional<std::string> field;

  bool operator==(const Diagnostic&) const = default;
};

using Diagnostics = std::vector<Diagnostic>;

[[nodiscard]] std::string severity_to_string(DiagnosticSeverity severity);
[[nodiscard]] std::string diagnostic_kind_to_string(DiagnosticKind kind);

[[nodiscard]] Diagnostic make_info(DiagnosticKind kind, std::string message,
                                   std::optional<std::string> entry_key = std::nullopt,
                                   std::optional<std::string> field = std::nullopt);
[[nodiscard]] Diagnostic make_warning(DiagnosticKind kind, std::string message,
                                      std::optional<std::string> entry_key = std::nullopt,
                                      std::optional<std::string> field = std::nullopt);
[[nodiscard]] Diagnostic make_error(DiagnosticKind kind, std::string message,
                                    std::optional<std::string> entry_key = std::nullopt,
                                    std::optional<std::string> field = std::nullopt);

// has_errors is the failure rule of a run: any error-severity diagnostic means failure.
[[nodiscard]] bool has_errors(const Diagnostics& diagnostics);

[[nodiscard]] std::size_t count_severity(const Diagnostics& diagnostics,
                                         DiagnosticSeverity severity);
[[nodiscard]] std::size_t count_kind(const Diagnostics& diagnostics, DiagnosticKind kind);

// format_diagnostic renders one line for the terminal:
//   "error [merge-conflict] Doe20.journal: message"
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diagnostic);

// append moves all diagnostics of `from` to the end of `to`, preserving order.
void append(Diagnostics& to, Diagnostics&& from);

}  // namespace bibsane::domain
