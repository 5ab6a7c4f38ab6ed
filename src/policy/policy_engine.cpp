#include "bibsane/policy/policy_engine.h"

#include "bibsane/core/normalization.h"

#include <utility>
#include <vector>

namespace bibsane::policy {

using domain::DiagnosticKind;

std::set<std::string> parse_policy_tags(const std::optional<std::string>& marker) {
  std::set<std::string> tags;
  if (!marker.has_value()) {
    return tags;
  }
  for (const auto& tag : core::split_list(marker.value())) {
    tags.insert(core::normalize_ascii_lower(tag));
  }
  return tags;
}

PolicyEngine::PolicyEngine(const config::Config& config,
                           const normalize::FieldNormalizer& normalizer)
    : config_(config), normalizer_(normalizer) {}

PolicyOutcome PolicyEngine::apply_policies(domain::Entry entry) const {
  PolicyOutcome outcome;

  if (entry.is_preamble()) {
    if (!config_.allow_preamble) {
      outcome.diagnostics.push_back(domain::make_error(DiagnosticKind::kPolicyViolation,
                                                       "@preamble is not allowed", entry.key));
      return outcome;
    }
    outcome.entry = std::move(entry);
    return outcome;
  }

  if (!admit_type(entry, outcome.diagnostics)) {
    return outcome;
  }

  const auto tags = parse_policy_tags(entry.get(config_.marker_field));
  remove_cruft(entry, tags, outcome.diagnostics);
  keep_allowed_fields(entry, tags, outcome.diagnostics);
  entry.erase(config_.marker_field);
  check_required(entry, tags, outcome.diagnostics);

  for (auto& field : entry.fields) {
    auto normalized = normalizer_.normalize_field(entry.key, field.name, field.value);
    field.value = std::move(normalized.value);
    domain::append(outcome.diagnostics, std::move(normalized.diagnostics));
  }

  outcome.entry = std::move(entry);
  return outcome;
}

bool PolicyEngine::admit_type(const domain::Entry& entry,
                              domain::Diagnostics& diagnostics) const {
  const bool unrecognized = entry.type == domain::EntryType::kUnrecognized;

  if (!config_.allowed_types.has_value()) {
    if (unrecognized) {
      diagnostics.push_back(domain::make_warning(DiagnosticKind::kUnrecognizedType,
                                                 "unrecognized entry type @" + entry.type_name,
                                                 entry.key));
    }
    return true;
  }

  if (unrecognized) {
    diagnostics.push_back(domain::make_error(
        DiagnosticKind::kPolicyViolation,
        "unrecognized entry type @" + entry.type_name + " is not allowed", entry.key));
    return false;
  }
  if (config_.allowed_types->count(entry.type) == 0) {
    diagnostics.push_back(domain::make_info(DiagnosticKind::kPolicyDrop,
                                            "dropped @" + entry.type_name +
                                                " entry (type not allowed)",
                                            entry.key));
    return false;
  }
  return true;
}

void PolicyEngine::remove_cruft(domain::Entry& entry, const std::set<std::string>& tags,
                                domain::Diagnostics& diagnostics) const {
  for (const auto& rule : config_.cruft) {
    if (!config::rule_applies(rule, entry.type, tags)) {
      continue;
    }
    for (const auto& field : rule.fields) {
      if (entry.erase(field)) {
        diagnostics.push_back(domain::make_info(DiagnosticKind::kFieldRemoved,
                                                "removed field " + field, entry.key, field));
      }
    }
  }
}

void PolicyEngine::keep_allowed_fields(domain::Entry& entry, const std::set<std::string>& tags,
                                       domain::Diagnostics& diagnostics) const {
  std::set<std::string> keep{config_.marker_field};
  bool restricted = false;
  for (const auto& rule : config_.allowed_fields) {
    if (config::rule_applies(rule, entry.type, tags)) {
      restricted = true;
      keep.insert(rule.fields.begin(), rule.fields.end());
    }
  }
  if (!restricted) {
    return;
  }
  for (const auto& rule : config_.required) {
    if (config::rule_applies(rule, entry.type, tags)) {
      keep.insert(rule.fields.begin(), rule.fields.end());
    }
  }

  std::vector<domain::Field> kept;
  kept.reserve(entry.fields.size());
  for (auto& field : entry.fields) {
    if (keep.count(field.name) > 0) {
      kept.push_back(std::move(field));
      continue;
    }
    diagnostics.push_back(domain::make_info(DiagnosticKind::kFieldRemoved,
                                            "removed field " + field.name +
                                                " (not allowed for @" + entry.type_name + ")",
                                            entry.key, field.name));
  }
  entry.fields = std::move(kept);
}

void PolicyEngine::check_required(const domain::Entry& entry, const std::set<std::string>& tags,
                                  domain::Diagnostics& diagnostics) const {
  std::set<std::string> reported;
  for (const auto& rule : config_.required) {
    if (!config::rule_applies(rule, entry.type, tags)) {
      continue;
    }
    for (const auto& field : rule.fields) {
      if (!entry.has(field) && reported.insert(field).second) {
        diagnostics.push_back(domain::make_error(DiagnosticKind::kMissingField,
                                                 "missing required field " + field, entry.key,
                                                 field));
      }
    }
  }
}

}  // namespace bibsane::policy
