#include "bibsane/emit/entry_sorter.h"

#include "bibsane/core/normalization.h"
#include "bibsane/emit/bibtex_writer.h"

#include <algorithm>
#include <charconv>
#include <tuple>
#include <utility>

namespace bibsane::emit {

namespace {

// First name of a BibTeX name list ("A and B and C"), split at brace depth 0.
std::string first_name(std::string_view names) {
  int depth = 0;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == '{') {
      ++depth;
    } else if (names[i] == '}') {
      --depth;
    } else if (depth == 0 && core::is_ascii_space(names[i]) && i + 4 < names.size() &&
               core::normalize_ascii_lower(names.substr(i + 1, 3)) == "and" &&
               core::is_ascii_space(names[i + 4])) {
      return core::trim(names.substr(0, i));
    }
  }
  return core::trim(names);
}

std::string family_name(std::string_view name) {
  int depth = 0;
  std::size_t last_token = 0;
  for (std::size_t i = 0; i < name.size(); ++i) {
    if (name[i] == '{') {
      ++depth;
    } else if (name[i] == '}') {
      --depth;
    } else if (depth == 0 && name[i] == ',') {
      return core::trim(name.substr(0, i));  // "Family, Given"
    } else if (depth == 0 && core::is_ascii_space(name[i])) {
      last_token = i + 1;
    }
  }
  return core::trim(name.substr(last_token));  // "Given Family"
}

struct SortKey {
  bool missing_year{true};
  int year{0};
  std::string family;
  std::string key;
  std::string rendered;

  auto tie() const { return std::tie(missing_year, year, family, key, rendered); }
};

}  // namespace

std::optional<int> parse_year(const domain::Entry& entry) {
  const auto* field = entry.find("year");
  if (field == nullptr) {
    return std::nullopt;
  }
  const std::string text = core::trim(*field);
  int year = 0;
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, year);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return year;
}

std::string first_author_family_name(const domain::Entry& entry) {
  const auto* names = entry.find("author");
  if (names == nullptr || core::trim(*names).empty()) {
    names = entry.find("editor");
  }
  if (names == nullptr) {
    return {};
  }
  return core::ascii_fold(family_name(first_name(*names)));
}

void sort_entries(std::vector<domain::Entry>& entries,
                  const std::vector<std::string>& field_order) {
  auto first_regular = std::stable_partition(
      entries.begin(), entries.end(), [](const domain::Entry& e) { return e.is_preamble(); });

  std::vector<std::pair<SortKey, domain::Entry>> keyed;
  keyed.reserve(static_cast<std::size_t>(entries.end() - first_regular));
  for (auto it = first_regular; it != entries.end(); ++it) {
    SortKey key;
    const auto year = parse_year(*it);
    key.missing_year = !year.has_value();
    key.year = year.value_or(0);
    key.family = first_author_family_name(*it);
    key.key = it->key;
    key.rendered = render_entry(*it, field_order);
    keyed.emplace_back(std::move(key), std::move(*it));
  }

  std::sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.first.tie() < rhs.first.tie();
  });

  auto out = first_regular;
  for (auto& item : keyed) {
    *out++ = std::move(item.second);
  }
}

}  // namespace bibsane::emit
