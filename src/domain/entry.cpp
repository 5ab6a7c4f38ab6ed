#include "bibsane/domain/entry.h"

#include "bibsane/core/normalization.h"

#include <algorithm>
#include <set>

namespace bibsane::domain {

const std::string* Entry::find(const std::string_view name) const {
  for (const auto& field : fields) {
    if (field.name == name) {
      return &field.value;
    }
  }
  return nullptr;
}

std::optional<std::string> Entry::get(const std::string_view name) const {
  const std::string* value = find(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return *value;
}

void Entry::set(const std::string_view name, std::string value) {
  for (auto& field : fields) {
    if (field.name == name) {
      field.value = std::move(value);
      return;
    }
  }
  fields.push_back(Field{std::string{name}, std::move(value)});
}

bool Entry::erase(const std::string_view name) {
  const auto it =
      std::find_if(fields.begin(), fields.end(), [&](const Field& f) { return f.name == name; });
  if (it == fields.end()) {
    return false;
  }
  fields.erase(it);
  return true;
}

core::Result<bool, std::string> Entry::validate() const {
  if (key.empty()) {
    return core::Result<bool, std::string>::err("entry key must not be empty");
  }

  std::set<std::string_view> seen;
  for (const auto& field : fields) {
    if (field.name.empty()) {
      return core::Result<bool, std::string>::err(key + ": field name must not be empty");
    }
    if (!seen.insert(field.name).second) {
      return core::Result<bool, std::string>::err(key + ": duplicate field " + field.name);
    }
  }

  return core::Result<bool, std::string>::ok(true);
}

Entry make_entry(const std::string_view type_name, std::string key,
                 std::vector<std::pair<std::string, std::string>> fields) {
  Entry entry;
  entry.type_name = core::normalize_ascii_lower(core::trim(type_name));
  entry.type = parse_entry_type(entry.type_name);
  entry.key = std::move(key);
  entry.fields.reserve(fields.size());
  for (auto& [name, value] : fields) {
    entry.fields.push_back(Field{std::move(name), std::move(value)});
  }
  return entry;
}

}  // namespace bibsane::domain
