#include "bibsane/normalize/field_normalizer.h"

#include "bibsane/core/normalization.h"

#include <array>

namespace bibsane::normalize {

namespace {

constexpr std::string_view kEnDash = "\xE2\x80\x93";

constexpr std::array<std::string_view, 5> kDoiPrefixes = {
    "https://doi.org/", "http://doi.org/", "https://dx.doi.org/", "http://dx.doi.org/", "doi:",
};

// Index of the '}' closing the '{' at `open`, or npos.
std::size_t matching_brace(std::string_view value, std::size_t open) {
  int depth = 0;
  for (std::size_t i = open; i < value.size(); ++i) {
    if (value[i] == '{') {
      ++depth;
    } else if (value[i] == '}') {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string_view::npos;
}

bool is_dash_at(std::string_view text, std::size_t pos) {
  return text[pos] == '-' || text.substr(pos, kEnDash.size()) == kEnDash;
}

bool contains_dash(std::string_view text) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_dash_at(text, i)) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool braces_balanced(std::string_view value) {
  int depth = 0;
  for (const char ch : value) {
    if (ch == '{') {
      ++depth;
    } else if (ch == '}') {
      if (--depth < 0) {
        return false;
      }
    }
  }
  return depth == 0;
}

std::string strip_enclosing_braces(std::string_view value) {
  std::string current = core::trim(value);
  while (current.size() >= 2 && current.front() == '{' &&
         matching_brace(current, 0) == current.size() - 1) {
    current = core::trim(std::string_view(current).substr(1, current.size() - 2));
  }
  return current;
}

DoiNormalization normalize_doi(std::string_view doi) {
  std::string value = core::normalize_ascii_lower(core::trim(doi));

  bool stripped = false;
  for (const auto prefix : kDoiPrefixes) {
    if (value.starts_with(prefix)) {
      value = core::trim(std::string_view(value).substr(prefix.size()));
      stripped = true;
      break;
    }
  }
  if (!stripped && (value.starts_with("http://") || value.starts_with("https://"))) {
    const auto pos = value.find("/10.");
    if (pos != std::string::npos) {
      value = value.substr(pos + 1);
    }
  }

  const bool valid = value.starts_with("10.") && value.find('/') != std::string::npos &&
                     value.find('/') + 1 < value.size();
  return DoiNormalization{value, valid};
}

std::string doi_merge_key(std::string_view doi) {
  return normalize_doi(doi).value;
}

PagesNormalization normalize_pages(std::string_view pages) {
  const std::string original(pages);
  const std::string_view text(original);

  if (text.find(',') != std::string_view::npos || !contains_dash(text)) {
    return PagesNormalization{original, PagesStatus::kUnchanged};
  }

  std::size_t sep_begin = 0;
  while (sep_begin < text.size() && !is_dash_at(text, sep_begin)) {
    ++sep_begin;
  }

  // The separator run: dashes with optional surrounding spaces.
  std::string separator;
  std::size_t sep_end = sep_begin;
  while (sep_end < text.size()) {
    if (text[sep_end] == '-') {
      separator.push_back('-');
      ++sep_end;
    } else if (text.substr(sep_end, kEnDash.size()) == kEnDash) {
      separator.append(kEnDash);
      sep_end += kEnDash.size();
    } else if (core::is_ascii_space(text[sep_end])) {
      ++sep_end;
    } else {
      break;
    }
  }

  const std::string first = core::trim(text.substr(0, sep_begin));
  const std::string last = core::trim(text.substr(sep_end));
  const bool known_separator = separator == "-" || separator == "--" || separator == kEnDash;
  if (first.empty() || last.empty() || !known_separator || contains_dash(last)) {
    return PagesNormalization{original, PagesStatus::kIrregular};
  }

  std::string canonical = first + "--" + last;
  if (canonical == original) {
    return PagesNormalization{original, PagesStatus::kUnchanged};
  }
  return PagesNormalization{std::move(canonical), PagesStatus::kNormalized};
}

FieldNormalizer::FieldNormalizer(const config::Config& config,
                                 lookup::IJournalAbbreviator* abbreviator)
    : config_(config), abbreviator_(abbreviator) {}

NormalizedField FieldNormalizer::normalize_field(const std::string& entry_key,
                                                 const std::string& field_name,
                                                 const std::string& value) const {
  NormalizedField result;
  result.value = config_.normalize_whitespace ? core::collapse_whitespace(value) : value;

  if (!braces_balanced(result.value)) {
    result.value = value;
    result.diagnostics.push_back(domain::make_error(domain::DiagnosticKind::kParseHazard,
                                                    "unbalanced braces in value", entry_key,
                                                    field_name));
    return result;
  }

  if (!config_.is_brace_exception(field_name)) {
    result.value = strip_enclosing_braces(result.value);
  }

  if (field_name == "doi" && config_.normalize_doi) {
    auto doi = normalize_doi(result.value);
    if (doi.valid) {
      result.value = std::move(doi.value);
    } else {
      result.diagnostics.push_back(domain::make_warning(
          domain::DiagnosticKind::kInvalidDoi,
          "DOI does not have the form 10.xxxx/...: " + result.value, entry_key, field_name));
    }
  } else if (field_name == "pages" && config_.normalize_pages) {
    auto pages = normalize_pages(result.value);
    if (pages.status == PagesStatus::kIrregular) {
      result.diagnostics.push_back(domain::make_warning(
          domain::DiagnosticKind::kIrregularPages,
          "irregular page range left unchanged: " + result.value, entry_key, field_name));
    } else {
      result.value = std::move(pages.value);
    }
  } else if (field_name == "journal" && config_.abbreviate_journals) {
    abbreviate_journal(entry_key, result);
  }

  return result;
}

void FieldNormalizer::abbreviate_journal(const std::string& entry_key,
                                         NormalizedField& field) const {
  // Names with a period are taken to be abbreviated already.
  if (abbreviator_ == nullptr || field.value.empty() ||
      field.value.find('.') != std::string::npos) {
    return;
  }

  auto abbreviation = abbreviator_->abbreviate(field.value);
  if (!abbreviation.has_value()) {
    field.diagnostics.push_back(domain::make_warning(domain::DiagnosticKind::kLookupDegradation,
                                                     abbreviation.error().message, entry_key,
                                                     "journal"));
    return;
  }
  field.value = abbreviation.value();
}

}  // namespace bibsane::normalize
