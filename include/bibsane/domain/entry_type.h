#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bibsane::domain {

/// BibTeX entry types known to the sanitizer.
/// Anything else parses as kUnrecognized; the original spelling is kept on the Entry.
enum class EntryType {
  kArticle,
  kBook,
  kBooklet,
  kConference,
  kInBook,
  kInCollection,
  kInProceedings,
  kManual,
  kMastersThesis,
  kMisc,
  kOnline,
  kPhdThesis,
  kProceedings,
  kTechReport,
  kUnpublished,
  kPreamble,
  kUnrecognized,
};

/// Convert EntryType to its lowercase BibTeX name ("unrecognized" for kUnrecognized)
[[nodiscard]] std::string entry_type_to_string(EntryType type);

/// Convert a BibTeX type name (any case) to EntryType.
/// Returns nullopt for names outside the known set.
[[nodiscard]] std::optional<EntryType> string_to_entry_type(std::string_view name);

/// Same as string_to_entry_type but maps unknown names to kUnrecognized
[[nodiscard]] EntryType parse_entry_type(std::string_view name);

}  // namespace bibsane::domain
