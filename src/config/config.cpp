#include "bibsane/config/config.h"

#include "bibsane/core/normalization.h"

#include <array>

namespace bibsane::config {

namespace {

constexpr std::array<std::string_view, 3> kAlwaysBraceExempt = {"author", "editor", "title"};

core::Result<bool, std::string> check_field_name(const std::string& name,
                                                 const std::string& context) {
  if (name.empty()) {
    return core::Result<bool, std::string>::err(context + ": empty field name");
  }
  if (name != core::normalize_ascii_lower(name)) {
    return core::Result<bool, std::string>::err(context + ": field name must be lowercase: " +
                                                name);
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> check_rules(const std::vector<FieldRule>& rules,
                                            const std::string& context) {
  for (const auto& rule : rules) {
    if (rule.type.has_value() && rule.type.value() == domain::EntryType::kUnrecognized) {
      return core::Result<bool, std::string>::err(context + ": rule names an unknown type");
    }
    if (rule.policy_tag.has_value() && rule.policy_tag->empty()) {
      return core::Result<bool, std::string>::err(context + ": empty policy tag");
    }
    for (const auto& field : rule.fields) {
      auto checked = check_field_name(field, context);
      if (!checked.has_value()) {
        return checked;
      }
    }
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

bool Config::is_brace_exception(const std::string_view field) const {
  for (const auto exempt : kAlwaysBraceExempt) {
    if (field == exempt) {
      return true;
    }
  }
  return brace_exceptions.find(std::string{field}) != brace_exceptions.end();
}

bool rule_applies(const FieldRule& rule, const domain::EntryType type,
                  const std::set<std::string>& policy_tags) {
  if (rule.type.has_value() && rule.type.value() != type) {
    return false;
  }
  if (rule.policy_tag.has_value() && policy_tags.count(rule.policy_tag.value()) == 0) {
    return false;
  }
  return true;
}

Config make_default_config() {
  return Config{};
}

core::Result<bool, std::string> validate_config(const Config& config) {
  if (config.allowed_types.has_value() &&
      config.allowed_types->count(domain::EntryType::kUnrecognized) > 0) {
    return core::Result<bool, std::string>::err("allowed_types: unknown type");
  }

  auto cruft = check_rules(config.cruft, "cruft");
  if (!cruft.has_value()) {
    return cruft;
  }
  auto allowed = check_rules(config.allowed_fields, "allowed_fields");
  if (!allowed.has_value()) {
    return allowed;
  }
  auto required = check_rules(config.required, "required");
  if (!required.has_value()) {
    return required;
  }

  for (const auto& field : config.brace_exceptions) {
    auto checked = check_field_name(field, "brace_exceptions");
    if (!checked.has_value()) {
      return checked;
    }
  }
  for (const auto& field : config.field_order) {
    auto checked = check_field_name(field, "field_order");
    if (!checked.has_value()) {
      return checked;
    }
  }

  if (config.marker_field.empty()) {
    return core::Result<bool, std::string>::err("marker_field must not be empty");
  }
  if (config.output.empty()) {
    return core::Result<bool, std::string>::err("output must not be empty");
  }
  if (config.lookup_timeout_ms <= 0) {
    return core::Result<bool, std::string>::err("lookup_timeout_ms must be positive");
  }

  return core::Result<bool, std::string>::ok(true);
}

}  // namespace bibsane::config
