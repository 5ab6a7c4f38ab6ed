#include "bibsane/merge/duplicate_resolver.h"

#include "bibsane/core/normalization.h"
#include "bibsane/normalize/field_normalizer.h"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

namespace bibsane::merge {

using domain::DiagnosticKind;
using domain::Entry;

namespace {

bool same_value(const std::string& field, const std::string& lhs, const std::string& rhs) {
  if (field == "doi") {
    return normalize::doi_merge_key(lhs) == normalize::doi_merge_key(rhs);
  }
  return lhs == rhs;
}

std::string join_keys(const std::vector<std::string>& keys) {
  std::string joined;
  for (const auto& key : keys) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += key;
  }
  return joined;
}

bool fields_less(const std::vector<domain::Field>& lhs, const std::vector<domain::Field>& rhs) {
  return std::lexicographical_compare(
      lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
      [](const domain::Field& a, const domain::Field& b) {
        return std::tie(a.name, a.value) < std::tie(b.name, b.value);
      });
}

// Total order on group members: shortest key, then smallest key, then content. The merge
// product only depends on this order, never on input order.
bool precedes(const Entry* lhs, const Entry* rhs) {
  if (lhs->key.size() != rhs->key.size()) {
    return lhs->key.size() < rhs->key.size();
  }
  if (lhs->key != rhs->key) {
    return lhs->key < rhs->key;
  }
  if (lhs->type_name != rhs->type_name) {
    return lhs->type_name < rhs->type_name;
  }
  if (lhs->fields != rhs->fields) {
    return fields_less(lhs->fields, rhs->fields);
  }
  return lhs->aliases < rhs->aliases;
}

std::vector<std::string> member_keys(const std::vector<const Entry*>& members) {
  std::vector<std::string> keys;
  for (const auto* member : members) {
    if (std::find(keys.begin(), keys.end(), member->key) == keys.end()) {
      keys.push_back(member->key);
    }
  }
  return keys;
}

void add_conflict(std::vector<FieldConflict>& conflicts, const std::string& field,
                  const std::string& first, const std::string& other) {
  auto it = std::find_if(conflicts.begin(), conflicts.end(),
                         [&](const FieldConflict& c) { return c.field == field; });
  if (it == conflicts.end()) {
    conflicts.push_back(FieldConflict{field, {first, other}});
    return;
  }
  if (std::find(it->values.begin(), it->values.end(), other) == it->values.end()) {
    it->values.push_back(other);
  }
}

// Working list: positions keep their slot so merged entries stay where their first member was.
using Slots = std::vector<std::optional<Entry>>;

class GroupMerger {
 public:
  GroupMerger(Slots& slots, domain::Diagnostics& diagnostics)
      : slots_(slots), diagnostics_(diagnostics) {}

  // Merges the entries at `positions` or reports conflicts; returns true on merge.
  bool merge(const std::vector<std::size_t>& positions, const std::string& reason) {
    std::vector<const Entry*> members;
    members.reserve(positions.size());
    for (const auto pos : positions) {
      members.push_back(&slots_[pos].value());
    }

    auto merged = merge_group(members);
    auto ordered = members;
    std::stable_sort(ordered.begin(), ordered.end(), precedes);
    const auto keys = member_keys(ordered);
    if (std::holds_alternative<std::vector<FieldConflict>>(merged)) {
      for (const auto& conflict : std::get<std::vector<FieldConflict>>(merged)) {
        diagnostics_.push_back(domain::make_error(
            DiagnosticKind::kMergeConflict,
            "cannot merge " + join_keys(keys) + " (" + reason + "): conflicting values for " +
                conflict.field,
            keys.front(), conflict.field));
      }
      return false;
    }

    Entry entry = std::move(std::get<Entry>(merged));
    diagnostics_.push_back(domain::make_info(
        DiagnosticKind::kMerged,
        "merged " + std::to_string(members.size()) + " entries (" + reason + "): " +
            join_keys(keys) + " -> " + entry.key,
        entry.key));

    slots_[positions.front()] = std::move(entry);
    for (std::size_t i = 1; i < positions.size(); ++i) {
      slots_[positions[i]].reset();
    }
    return true;
  }

 private:
  Slots& slots_;
  domain::Diagnostics& diagnostics_;
};

// Groups of two or more entries sharing a normalized DOI, in order of first appearance.
std::vector<std::pair<std::string, std::vector<std::size_t>>> group_by_doi(const Slots& slots) {
  std::map<std::string, std::vector<std::size_t>> by_doi;
  std::vector<std::string> doi_order;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (slots[i]->is_preamble()) {
      continue;
    }
    const auto doi = slots[i]->get("doi");
    if (!doi.has_value()) {
      continue;
    }
    const auto merge_key = normalize::doi_merge_key(doi.value());
    if (merge_key.empty()) {
      continue;
    }
    auto& group = by_doi[merge_key];
    if (group.empty()) {
      doi_order.push_back(merge_key);
    }
    group.push_back(i);
  }

  std::vector<std::pair<std::string, std::vector<std::size_t>>> groups;
  for (const auto& doi : doi_order) {
    if (by_doi[doi].size() > 1) {
      groups.emplace_back(doi, std::move(by_doi[doi]));
    }
  }
  return groups;
}

// A citation key held by a surviving entry, either as its key or as an alias.
struct KeyClaim {
  std::string key;
  std::size_t owner;
  bool alias;
};

}  // namespace

std::variant<Entry, std::vector<FieldConflict>> merge_group(
    const std::vector<const Entry*>& members) {
  std::vector<FieldConflict> conflicts;

  std::vector<const Entry*> ordered = members;
  std::stable_sort(ordered.begin(), ordered.end(), precedes);
  const Entry* primary = ordered.front();

  for (const auto* member : ordered) {
    if (member->type_name != primary->type_name) {
      add_conflict(conflicts, "type", primary->type_name, member->type_name);
    }
  }

  Entry merged = *primary;
  std::set<std::string> aliases(primary->aliases.begin(), primary->aliases.end());
  for (std::size_t i = 1; i < ordered.size(); ++i) {
    const Entry* member = ordered[i];
    aliases.insert(member->key);
    aliases.insert(member->aliases.begin(), member->aliases.end());
    for (const auto& field : member->fields) {
      const std::string* existing = merged.find(field.name);
      if (existing == nullptr) {
        merged.fields.push_back(field);
      } else if (!same_value(field.name, *existing, field.value)) {
        add_conflict(conflicts, field.name, *existing, field.value);
      }
    }
  }

  if (!conflicts.empty()) {
    return conflicts;
  }

  aliases.erase(merged.key);
  merged.aliases.assign(aliases.begin(), aliases.end());
  return merged;
}

DuplicateResolver::DuplicateResolver(const config::Config& config) : config_(config) {}

MergeOutcome DuplicateResolver::resolve_duplicates(std::vector<Entry> entries) const {
  MergeOutcome outcome;
  Slots slots;
  slots.reserve(entries.size());
  for (auto& entry : entries) {
    slots.emplace_back(std::move(entry));
  }
  GroupMerger merger(slots, outcome.diagnostics);

  // Failed DOI groups, by position, so the key pass does not report the same pair twice.
  std::map<std::size_t, std::size_t> failed_doi_group;

  const auto doi_groups = group_by_doi(slots);
  for (std::size_t g = 0; g < doi_groups.size(); ++g) {
    const auto& [doi, positions] = doi_groups[g];
    if (config_.merge_on_doi) {
      if (!merger.merge(positions, "same DOI " + doi)) {
        for (const auto pos : positions) {
          failed_doi_group[pos] = g;
        }
      }
    } else if (config_.fail_on_duplicate_doi) {
      std::vector<const Entry*> members;
      for (const auto pos : positions) {
        members.push_back(&slots[pos].value());
      }
      std::stable_sort(members.begin(), members.end(), precedes);
      const auto keys = member_keys(members);
      outcome.diagnostics.push_back(domain::make_error(
          DiagnosticKind::kDuplicateDoi, "DOI " + doi + " is shared by " + join_keys(keys),
          keys.front(), "doi"));
    }
  }

  std::map<std::string, std::vector<std::size_t>> by_key;
  std::vector<std::string> key_order;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (!slots[i].has_value() || slots[i]->is_preamble()) {
      continue;
    }
    auto& group = by_key[slots[i]->key];
    if (group.empty()) {
      key_order.push_back(slots[i]->key);
    }
    group.push_back(i);
  }

  for (const auto& key : key_order) {
    const auto& positions = by_key[key];
    if (positions.size() < 2) {
      continue;
    }
    const auto first_failed = failed_doi_group.find(positions.front());
    const bool already_reported =
        first_failed != failed_doi_group.end() &&
        std::all_of(positions.begin(), positions.end(), [&](std::size_t pos) {
          const auto it = failed_doi_group.find(pos);
          return it != failed_doi_group.end() && it->second == first_failed->second;
        });
    if (already_reported) {
      continue;
    }
    if (config_.merge_on_key) {
      merger.merge(positions, "same key");
    } else {
      outcome.diagnostics.push_back(domain::make_error(
          DiagnosticKind::kDuplicateKey,
          "key used by " + std::to_string(positions.size()) + " entries", key));
    }
  }

  // Keys and aliases equal up to letter case, in order of first appearance. Claims held by
  // one entry never clash with each other; identical keys of two entries were handled above.
  std::map<std::string, std::vector<KeyClaim>> by_folded_key;
  std::vector<std::string> folded_order;
  const auto add_claim = [&](const std::string& key, std::size_t owner, bool alias) {
    const auto folded = core::normalize_ascii_lower(key);
    auto& claims = by_folded_key[folded];
    if (claims.empty()) {
      folded_order.push_back(folded);
    }
    claims.push_back(KeyClaim{key, owner, alias});
  };
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (!slots[i].has_value() || slots[i]->is_preamble()) {
      continue;
    }
    add_claim(slots[i]->key, i, false);
    for (const auto& alias : slots[i]->aliases) {
      add_claim(alias, i, true);
    }
  }

  for (const auto& folded : folded_order) {
    const auto& claims = by_folded_key[folded];
    std::set<std::pair<std::string, std::string>> reported;
    for (std::size_t i = 0; i < claims.size(); ++i) {
      for (std::size_t j = i + 1; j < claims.size(); ++j) {
        const auto& first = claims[i];
        const auto& second = claims[j];
        if (first.owner == second.owner) {
          continue;
        }
        if (first.key == second.key) {
          if (!first.alias && !second.alias) {
            continue;
          }
          if (reported.emplace(first.key, second.key).second) {
            outcome.diagnostics.push_back(domain::make_error(
                DiagnosticKind::kDuplicateKey,
                "key " + first.key + " names one entry and was merged into another",
                first.key));
          }
          continue;
        }
        const auto pair = std::minmax(first.key, second.key);
        if (reported.emplace(pair.first, pair.second).second) {
          outcome.diagnostics.push_back(domain::make_error(
              DiagnosticKind::kKeyCollision,
              "keys " + first.key + " and " + second.key + " differ only by letter case",
              first.key));
        }
      }
    }
  }

  for (auto& slot : slots) {
    if (slot.has_value()) {
      outcome.entries.push_back(std::move(slot.value()));
    }
  }
  return outcome;
}

}  // namespace bibsane::merge
