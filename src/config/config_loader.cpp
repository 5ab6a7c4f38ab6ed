#include "bibsane/config/config_loader.h"

#include "bibsane/core/normalization.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace bibsane::config {

namespace {

const std::unordered_set<std::string> kKnownOptions = {
    "allowed_types",         "cruft",
    "allowed_fields",        "required",
    "brace_exceptions",      "marker_field",
    "merge_on_doi",          "duplicate_doi",
    "merge_on_key",          "allow_preamble",
    "normalize_whitespace",  "normalize_doi",
    "normalize_pages",       "abbreviate_journals",
    "sort",                  "field_order",
    "journal_abbreviations", "abbreviation_cache",
    "lookup_timeout_ms",     "output",
};

const std::unordered_set<std::string> kKnownRuleKeys = {"type", "policy", "fields"};

std::string yaml_node_class(const YAML::Node& node) {
  if (!node || node.IsNull()) {
    return "null";
  }
  if (node.IsScalar()) {
    return "scalar";
  }
  if (node.IsSequence()) {
    return "sequence";
  }
  if (node.IsMap()) {
    return "map";
  }
  return "unknown";
}

void push_type_mismatch(std::vector<std::string>& errors, const std::string& path,
                        const std::string& expected, const YAML::Node& received) {
  errors.push_back("type mismatch at '" + path + "' (expected " + expected + ", got " +
                   yaml_node_class(received) + ")");
}

std::optional<bool> parse_bool(const YAML::Node& node, const std::string& path,
                               std::vector<std::string>& errors) {
  if (!node) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    push_type_mismatch(errors, path, "boolean", node);
    return std::nullopt;
  }
  try {
    return node.as<bool>();
  } catch (const YAML::Exception&) {
    push_type_mismatch(errors, path, "boolean", node);
    return std::nullopt;
  }
}

std::optional<long> parse_long(const YAML::Node& node, const std::string& path,
                               std::vector<std::string>& errors) {
  if (!node) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    push_type_mismatch(errors, path, "integer", node);
    return std::nullopt;
  }
  try {
    return node.as<long>();
  } catch (const YAML::Exception&) {
    push_type_mismatch(errors, path, "integer", node);
    return std::nullopt;
  }
}

std::optional<std::string> parse_string(const YAML::Node& node, const std::string& path,
                                        std::vector<std::string>& errors) {
  if (!node) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    push_type_mismatch(errors, path, "string", node);
    return std::nullopt;
  }
  return node.as<std::string>();
}

// A sequence of strings; a single scalar is accepted as a one-element list.
std::optional<std::vector<std::string>> parse_string_list(const YAML::Node& node,
                                                          const std::string& path,
                                                          std::vector<std::string>& errors) {
  if (!node) {
    return std::nullopt;
  }
  if (node.IsScalar()) {
    return std::vector<std::string>{node.as<std::string>()};
  }
  if (!node.IsSequence()) {
    push_type_mismatch(errors, path, "sequence", node);
    return std::nullopt;
  }

  std::vector<std::string> items;
  for (std::size_t i = 0; i < node.size(); ++i) {
    const auto item = parse_string(node[i], path + "[" + std::to_string(i) + "]", errors);
    if (item.has_value()) {
      items.push_back(item.value());
    }
  }
  return items;
}

std::vector<std::string> lowercase_all(const std::vector<std::string>& names) {
  std::vector<std::string> result;
  result.reserve(names.size());
  for (const auto& name : names) {
    result.push_back(core::normalize_ascii_lower(core::trim(name)));
  }
  return result;
}

std::vector<FieldRule> parse_rules(const YAML::Node& node, const std::string& path,
                                   std::vector<std::string>& errors) {
  std::vector<FieldRule> rules;
  if (!node) {
    return rules;
  }
  if (!node.IsSequence()) {
    push_type_mismatch(errors, path, "sequence", node);
    return rules;
  }

  for (std::size_t i = 0; i < node.size(); ++i) {
    const YAML::Node item = node[i];
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    if (!item.IsMap()) {
      push_type_mismatch(errors, item_path, "map", item);
      continue;
    }
    for (const auto& kv : item) {
      const std::string key = kv.first.as<std::string>();
      if (kKnownRuleKeys.count(key) == 0) {
        errors.push_back("unknown option '" + item_path + "." + key + "'");
      }
    }

    FieldRule rule;
    const auto type_name = parse_string(item["type"], item_path + ".type", errors);
    if (!type_name.has_value()) {
      errors.push_back("missing '" + item_path + ".type'");
      continue;
    }
    if (core::trim(type_name.value()) != "*") {
      const auto type = domain::string_to_entry_type(type_name.value());
      if (!type.has_value()) {
        errors.push_back("unknown entry type '" + type_name.value() + "' at '" + item_path +
                         ".type'");
        continue;
      }
      rule.type = type;
    }

    const auto policy = parse_string(item["policy"], item_path + ".policy", errors);
    if (policy.has_value()) {
      rule.policy_tag = core::normalize_ascii_lower(core::trim(policy.value()));
    }

    const auto fields = parse_string_list(item["fields"], item_path + ".fields", errors);
    if (fields.has_value()) {
      rule.fields = lowercase_all(fields.value());
    }
    rules.push_back(std::move(rule));
  }
  return rules;
}

void apply_bool(const YAML::Node& root, const char* name, bool& target,
                std::vector<std::string>& errors) {
  const auto value = parse_bool(root[name], name, errors);
  if (value.has_value()) {
    target = value.value();
  }
}

// duplicate_doi: merge | fail | ignore. Overrides merge_on_doi, so both may not be given.
void apply_duplicate_doi(const YAML::Node& root, Config& config,
                         std::vector<std::string>& errors) {
  const auto policy = parse_string(root["duplicate_doi"], "duplicate_doi", errors);
  if (!policy.has_value()) {
    return;
  }
  if (root["merge_on_doi"]) {
    errors.push_back("'duplicate_doi' and 'merge_on_doi' are mutually exclusive");
    return;
  }

  const std::string value = core::normalize_ascii_lower(core::trim(policy.value()));
  if (value == "merge") {
    config.merge_on_doi = true;
    config.fail_on_duplicate_doi = false;
  } else if (value == "fail") {
    config.merge_on_doi = false;
    config.fail_on_duplicate_doi = true;
  } else if (value == "ignore") {
    config.merge_on_doi = false;
    config.fail_on_duplicate_doi = false;
  } else {
    errors.push_back("invalid value '" + policy.value() +
                     "' for 'duplicate_doi' (expected merge, fail or ignore)");
  }
}

ConfigResult map_document(const YAML::Node& root) {
  Config config = make_default_config();
  if (!root || root.IsNull()) {
    return ConfigResult::ok(config);
  }
  if (!root.IsMap()) {
    return ConfigResult::err(ConfigError{"configuration must be a map, got " +
                                         yaml_node_class(root)});
  }

  std::vector<std::string> errors;

  for (const auto& kv : root) {
    const std::string key = kv.first.as<std::string>();
    if (kKnownOptions.count(key) == 0) {
      errors.push_back("unknown option '" + key + "'");
    }
  }

  const auto allowed = parse_string_list(root["allowed_types"], "allowed_types", errors);
  if (allowed.has_value()) {
    std::set<domain::EntryType> types;
    for (const auto& name : allowed.value()) {
      const auto type = domain::string_to_entry_type(name);
      if (type.has_value()) {
        types.insert(type.value());
      } else {
        errors.push_back("unknown entry type '" + name + "' in 'allowed_types'");
      }
    }
    config.allowed_types = std::move(types);
  }

  config.cruft = parse_rules(root["cruft"], "cruft", errors);
  config.allowed_fields = parse_rules(root["allowed_fields"], "allowed_fields", errors);
  config.required = parse_rules(root["required"], "required", errors);

  const auto exceptions = parse_string_list(root["brace_exceptions"], "brace_exceptions", errors);
  if (exceptions.has_value()) {
    const auto lowered = lowercase_all(exceptions.value());
    config.brace_exceptions = std::set<std::string>(lowered.begin(), lowered.end());
  }

  const auto marker = parse_string(root["marker_field"], "marker_field", errors);
  if (marker.has_value()) {
    config.marker_field = core::normalize_ascii_lower(core::trim(marker.value()));
  }

  apply_bool(root, "merge_on_doi", config.merge_on_doi, errors);
  apply_duplicate_doi(root, config, errors);
  apply_bool(root, "merge_on_key", config.merge_on_key, errors);
  apply_bool(root, "allow_preamble", config.allow_preamble, errors);
  apply_bool(root, "normalize_whitespace", config.normalize_whitespace, errors);
  apply_bool(root, "normalize_doi", config.normalize_doi, errors);
  apply_bool(root, "normalize_pages", config.normalize_pages, errors);
  apply_bool(root, "abbreviate_journals", config.abbreviate_journals, errors);
  apply_bool(root, "sort", config.sort, errors);

  const auto order = parse_string_list(root["field_order"], "field_order", errors);
  if (order.has_value()) {
    config.field_order = lowercase_all(order.value());
  }

  const YAML::Node table = root["journal_abbreviations"];
  if (table) {
    if (table.IsMap()) {
      for (const auto& kv : table) {
        const std::string name = kv.first.as<std::string>();
        const auto abbrev =
            parse_string(kv.second, "journal_abbreviations." + name, errors);
        if (abbrev.has_value()) {
          config.journal_abbreviations[name] = abbrev.value();
        }
      }
    } else {
      push_type_mismatch(errors, "journal_abbreviations", "map", table);
    }
  }

  const auto cache = parse_string(root["abbreviation_cache"], "abbreviation_cache", errors);
  if (cache.has_value()) {
    config.abbreviation_cache = cache.value();
  }

  const auto timeout = parse_long(root["lookup_timeout_ms"], "lookup_timeout_ms", errors);
  if (timeout.has_value()) {
    config.lookup_timeout_ms = timeout.value();
  }

  const auto output = parse_string(root["output"], "output", errors);
  if (output.has_value()) {
    config.output = output.value();
  }

  if (errors.empty()) {
    auto valid = validate_config(config);
    if (!valid.has_value()) {
      errors.push_back(valid.error());
    }
  }

  if (!errors.empty()) {
    std::string message = errors.front();
    for (std::size_t i = 1; i < errors.size(); ++i) {
      message += "; " + errors[i];
    }
    return ConfigResult::err(ConfigError{message});
  }

  return ConfigResult::ok(std::move(config));
}

}  // namespace

ConfigResult load_config_yaml(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    return ConfigResult::err(ConfigError{std::string("YAML parse error: ") + e.what()});
  }

  try {
    return map_document(root);
  } catch (const YAML::Exception& e) {
    return ConfigResult::err(ConfigError{std::string("invalid configuration: ") + e.what()});
  }
}

ConfigResult load_config_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return ConfigResult::err(ConfigError{"Failed to open config file: " + path});
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  auto result = load_config_yaml(buffer.str());
  if (!result.has_value()) {
    return ConfigResult::err(ConfigError{path + ": " + result.error().message});
  }
  return result;
}

}  // namespace bibsane::config
