#pragma once

#include "bibsane/core/result.h"
#include "bibsane/domain/entry_type.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bibsane::domain {

struct Field {
  std::string name;
  std::string value;

  bool operator==(const Field&) const = default;
};

// Entry is one bibliographic record as handed over by the parser.
// This is a struct (not class) per C++ Core Guidelines C.2: the sanitizer passes rewrite
// fields freely. Invariants are checked via validate():
// - key is non-empty
// - field names are non-empty and unique
//
// Fields keep the order in which they were first encountered. Lookups are linear; BibTeX
// entries carry a handful of fields, so a vector beats a map and keeps the order for free.
struct Entry {
  EntryType type{EntryType::kUnrecognized};
  std::string type_name;  // Lowercase spelling as read (used for rendering)
  std::string key;
  std::vector<Field> fields;
  std::vector<std::string> aliases;  // Keys merged into this entry, never rendered

  [[nodiscard]] const std::string* find(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
  [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

  // set replaces an existing value in place or appends a new field at the end.
  void set(std::string_view name, std::string value);

  // erase removes the named field; returns false if it was absent.
  bool erase(std::string_view name);

  [[nodiscard]] bool is_preamble() const noexcept { return type == EntryType::kPreamble; }

  [[nodiscard]] core::Result<bool, std::string> validate() const;

  bool operator==(const Entry&) const = default;
};

// make_entry builds an Entry from a type name, a key and fields in order.
// The type name is lowercased and resolved against the known EntryType set.
[[nodiscard]] Entry make_entry(std::string_view type_name, std::string key,
                               std::vector<std::pair<std::string, std::string>> fields);

}  // namespace bibsane::domain
