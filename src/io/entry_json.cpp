#include "bibsane/io/entry_json.h"

#include "bibsane/core/normalization.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace bibsane::io {

namespace {

using ordered_json = nlohmann::ordered_json;

domain::Entry make_preamble(std::string value, std::size_t index) {
  // Parsers differ on whether the quotes of @preamble{"..."} are kept.
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return domain::make_entry("preamble", "@preamble-" + std::to_string(index),
                            {{"preamble", std::move(value)}});
}

core::Result<domain::Entry, std::string> entry_from_json(const ordered_json& object,
                                                         std::size_t position,
                                                         std::size_t& preamble_count) {
  using EntryResult = core::Result<domain::Entry, std::string>;
  const std::string where = "entry #" + std::to_string(position);

  if (!object.is_object()) {
    return EntryResult::err(where + ": expected an object");
  }
  const auto type_it = object.find("ENTRYTYPE");
  if (type_it == object.end() || !type_it->is_string()) {
    return EntryResult::err(where + ": missing string member ENTRYTYPE");
  }
  const std::string type_name = core::normalize_ascii_lower(type_it->get<std::string>());

  if (type_name == "preamble") {
    const auto value = object.find("preamble");
    if (value == object.end() || !value->is_string()) {
      return EntryResult::err(where + ": preamble without string member 'preamble'");
    }
    return EntryResult::ok(make_preamble(value->get<std::string>(), preamble_count++));
  }

  const auto id_it = object.find("ID");
  if (id_it == object.end() || !id_it->is_string()) {
    return EntryResult::err(where + ": missing string member ID");
  }
  const std::string key = id_it->get<std::string>();

  std::vector<std::pair<std::string, std::string>> fields;
  for (const auto& [name, value] : object.items()) {
    if (name == "ENTRYTYPE" || name == "ID") {
      continue;
    }
    if (!value.is_string()) {
      return EntryResult::err(where + " (" + key + "): field '" + name + "' is not a string");
    }
    fields.emplace_back(core::normalize_ascii_lower(name), value.get<std::string>());
  }

  auto entry = domain::make_entry(type_name, key, std::move(fields));
  auto valid = entry.validate();
  if (!valid.has_value()) {
    return EntryResult::err(where + ": " + valid.error());
  }
  return EntryResult::ok(std::move(entry));
}

}  // namespace

EntriesResult read_entries_json(const std::string& text) {
  ordered_json document;
  try {
    document = ordered_json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    return EntriesResult::err(std::string("JSON parse error: ") + e.what());
  }

  const ordered_json* list = &document;
  const ordered_json* preambles = nullptr;
  if (document.is_object()) {
    const auto entries_it = document.find("entries");
    if (entries_it == document.end()) {
      return EntriesResult::err("JSON object without 'entries' array");
    }
    list = &*entries_it;
    const auto preambles_it = document.find("preambles");
    if (preambles_it != document.end()) {
      if (!preambles_it->is_array()) {
        return EntriesResult::err("'preambles' must be an array");
      }
      preambles = &*preambles_it;
    }
  }
  if (!list->is_array()) {
    return EntriesResult::err("expected an array of entries");
  }

  std::vector<domain::Entry> entries;
  std::size_t preamble_count = 0;
  if (preambles != nullptr) {
    for (const auto& item : *preambles) {
      if (!item.is_string()) {
        return EntriesResult::err("'preambles' items must be strings");
      }
      entries.push_back(make_preamble(item.get<std::string>(), preamble_count++));
    }
  }

  for (std::size_t i = 0; i < list->size(); ++i) {
    auto entry = entry_from_json((*list)[i], i, preamble_count);
    if (!entry.has_value()) {
      return EntriesResult::err(entry.error());
    }
    entries.push_back(std::move(entry.value()));
  }
  return EntriesResult::ok(std::move(entries));
}

EntriesResult read_entries_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return EntriesResult::err("Failed to open entries file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  auto result = read_entries_json(buffer.str());
  if (!result.has_value()) {
    return EntriesResult::err(path + ": " + result.error());
  }
  return result;
}

}  // namespace bibsane::io
