#pragma once

#include "bibsane/config/config.h"
#include "bibsane/domain/diagnostic.h"
#include "bibsane/domain/entry.h"
#include "bibsane/normalize/field_normalizer.h"

#include <optional>
#include <set>
#include <string>

namespace bibsane::policy {

struct PolicyOutcome {
  std::optional<domain::Entry> entry;  // nullopt = dropped
  domain::Diagnostics diagnostics;
};

// parse_policy_tags reads the marker field value into a lowercase tag set.
// Tags are separated by commas, semicolons or whitespace.
[[nodiscard]] std::set<std::string> parse_policy_tags(const std::optional<std::string>& marker);

// PolicyEngine applies the entry-local rules of a Config to one entry at a time:
//   - preamble rejection (allow_preamble = false)
//   - type admission against allowed_types
//   - cruft removal by type and policy tag
//   - allow-list filtering (allowed_fields), then removal of the marker field
//   - required-field checks
//   - value normalization of every remaining field
//
// Both collaborators are borrowed and must outlive the engine.
class PolicyEngine {
 public:
  PolicyEngine(const config::Config& config, const normalize::FieldNormalizer& normalizer);

  [[nodiscard]] PolicyOutcome apply_policies(domain::Entry entry) const;

 private:
  // Returns false when the entry must be dropped.
  [[nodiscard]] bool admit_type(const domain::Entry& entry,
                                domain::Diagnostics& diagnostics) const;
  void remove_cruft(domain::Entry& entry, const std::set<std::string>& tags,
                    domain::Diagnostics& diagnostics) const;
  void keep_allowed_fields(domain::Entry& entry, const std::set<std::string>& tags,
                           domain::Diagnostics& diagnostics) const;
  void check_required(const domain::Entry& entry, const std::set<std::string>& tags,
                      domain::Diagnostics& diagnostics) const;

  const config::Config& config_;
  const normalize::FieldNormalizer& normalizer_;
};

}  // namespace bibsane::policy
