#include "bibsane/domain/entry_type.h"

#include "bibsane/core/normalization.h"

#include <array>
#include <utility>

namespace bibsane::domain {

namespace {

constexpr std::array<std::pair<std::string_view, EntryType>, 16> kTypeNames = {{
    {"article", EntryType::kArticle},
    {"book", EntryType::kBook},
    {"booklet", EntryType::kBooklet},
    {"conference", EntryType::kConference},
    {"inbook", EntryType::kInBook},
    {"incollection", EntryType::kInCollection},
    {"inproceedings", EntryType::kInProceedings},
    {"manual", EntryType::kManual},
    {"mastersthesis", EntryType::kMastersThesis},
    {"misc", EntryType::kMisc},
    {"online", EntryType::kOnline},
    {"phdthesis", EntryType::kPhdThesis},
    {"proceedings", EntryType::kProceedings},
    {"techreport", EntryType::kTechReport},
    {"unpublished", EntryType::kUnpublished},
    {"preamble", EntryType::kPreamble},
}};

}  // namespace

std::string entry_type_to_string(const EntryType type) {
  for (const auto& [name, value] : kTypeNames) {
    if (value == type) {
      return std::string{name};
    }
  }
  return "unrecognized";
}

std::optional<EntryType> string_to_entry_type(const std::string_view name) {
  const std::string lowered = core::normalize_ascii_lower(core::trim(name));
  for (const auto& [type_name, value] : kTypeNames) {
    if (type_name == lowered) {
      return value;
    }
  }
  return std::nullopt;
}

EntryType parse_entry_type(const std::string_view name) {
  return string_to_entry_type(name).value_or(EntryType::kUnrecognized);
}

}  // namespace bibsane::domain
