#pragma once

#include "bibsane/config/config.h"
#include "bibsane/domain/diagnostic.h"
#include "bibsane/lookup/journal_abbreviator.h"

#include <string>
#include <string_view>

namespace bibsane::normalize {

// braces_balanced: every '}' closes an earlier '{' and nothing is left open.
[[nodiscard]] bool braces_balanced(std::string_view value);

// strip_enclosing_braces removes brace pairs that span the whole (trimmed) value, one group
// at a time: "{{Nature}}" -> "Nature". Braces around part of the value stay:
// "{DNA} repair" and "{A} and {B}" are returned unchanged. Expects balanced input.
[[nodiscard]] std::string strip_enclosing_braces(std::string_view value);

struct DoiNormalization {
  std::string value;
  bool valid{false};  // bare "10.<registrant>/<suffix>" form
};

// normalize_doi lowercases and strips resolver prefixes (https://doi.org/, dx.doi.org,
// "doi:", or any URL up to its "/10." path segment).
[[nodiscard]] DoiNormalization normalize_doi(std::string_view doi);

// doi_merge_key is the comparison form used to group and compare DOIs.
[[nodiscard]] std::string doi_merge_key(std::string_view doi);

enum class PagesStatus {
  kUnchanged,   // already canonical, single page or comma list
  kNormalized,  // rewritten to "a--b"
  kIrregular,   // separator could not be canonicalized, value kept
};

struct PagesNormalization {
  std::string value;
  PagesStatus status{PagesStatus::kUnchanged};
};

// normalize_pages rewrites "a-b", "a – b" (en dash) and "a -- b" to "a--b".
[[nodiscard]] PagesNormalization normalize_pages(std::string_view pages);

struct NormalizedField {
  std::string value;
  domain::Diagnostics diagnostics;
};

// FieldNormalizer cleans one field value at a time according to Config.
//
// Steps, in order:
//   1. whitespace collapse (normalize_whitespace)
//   2. brace balance check; unbalanced values are returned untouched with an error
//   3. enclosing brace stripping unless the field is a brace exception
//   4. doi / pages / journal specific rewriting
//
// The journal abbreviator is optional and borrowed; it must outlive the normalizer.
class FieldNormalizer {
 public:
  explicit FieldNormalizer(const config::Config& config,
                           lookup::IJournalAbbreviator* abbreviator = nullptr);

  [[nodiscard]] NormalizedField normalize_field(const std::string& entry_key,
                                                const std::string& field_name,
                                                const std::string& value) const;

 private:
  void abbreviate_journal(const std::string& entry_key, NormalizedField& field) const;

  const config::Config& config_;
  lookup::IJournalAbbreviator* abbreviator_;
};

}  // namespace bibsane::normalize
