#pragma once

#include "bibsane/core/result.h"
#include "bibsane/domain/entry_type.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace bibsane::config {

// FieldRule names fields for one entry type (or every type) and optionally one policy tag.
// Used for cruft removal, field allow-lists and required-field checks.
struct FieldRule {
  std::optional<domain::EntryType> type;  // nullopt = wildcard "*"
  std::optional<std::string> policy_tag;  // nullopt = applies regardless of tags
  std::vector<std::string> fields;

  bool operator==(const FieldRule&) const = default;
};

// Config holds every sanitizer option. Every field has an explicit default; optional fields
// mean "not configured". A Config is built once at startup and only ever passed by const
// reference afterwards.
struct Config {
  // Type admission. nullopt = every type admitted.
  std::optional<std::set<domain::EntryType>> allowed_types;

  std::vector<FieldRule> cruft;
  // When at least one rule applies to an entry, only the fields named by the applicable
  // allowed_fields and required rules are kept.
  std::vector<FieldRule> allowed_fields;
  std::vector<FieldRule> required;

  // Fields exempt from brace stripping in addition to author, editor and title.
  std::set<std::string> brace_exceptions{"note"};
  std::string marker_field{"bibsane"};

  bool merge_on_doi{true};
  // Only consulted without merge_on_doi: entries sharing a DOI are errors.
  bool fail_on_duplicate_doi{false};
  bool merge_on_key{true};
  bool allow_preamble{true};
  bool normalize_whitespace{true};
  bool normalize_doi{true};
  bool normalize_pages{true};
  bool abbreviate_journals{false};
  bool sort{true};

  // Canonical rendering order; fields not listed follow in encounter order.
  std::vector<std::string> field_order;

  // Fixed journal abbreviations consulted before the lookup service.
  std::map<std::string, std::string> journal_abbreviations;
  std::optional<std::string> abbreviation_cache;  // SQLite path
  long lookup_timeout_ms{10000};

  std::string output{"references.bib"};

  // author, editor and title are always exempt; brace_exceptions adds to them.
  [[nodiscard]] bool is_brace_exception(std::string_view field) const;
};

// rule_applies: the rule type is the wildcard or equals `type`, and the rule tag (if any) is
// one of the entry's policy tags.
[[nodiscard]] bool rule_applies(const FieldRule& rule, domain::EntryType type,
                                const std::set<std::string>& policy_tags);

[[nodiscard]] Config make_default_config();

// validate_config checks the identifiers referenced by rules.
// Field names must be non-empty lowercase; kUnrecognized may not appear in any type slot.
[[nodiscard]] core::Result<bool, std::string> validate_config(const Config& config);

}  // namespace bibsane::config
