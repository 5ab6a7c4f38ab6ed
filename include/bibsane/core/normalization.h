#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bibsane::core {

// Deterministic ASCII-only string utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers:
// - ASCII lowercasing: A-Z → a-z via explicit char math (no std::tolower)
// - Whitespace is exactly space, tab, CR, LF, vertical tab and form feed
// - Non-ASCII bytes are never interpreted except by ascii_fold()

[[nodiscard]] constexpr bool is_ascii_space(const char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

[[nodiscard]] constexpr bool is_ascii_digit(const char ch) noexcept {
  return ch >= '0' && ch <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alpha(const char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

[[nodiscard]] constexpr char to_ascii_lower(const char ch) noexcept {
  constexpr char kCaseOffset = 'a' - 'A';
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + kCaseOffset) : ch;
}

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    result.push_back(to_ascii_lower(ch));
  }
  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// collapse_whitespace replaces every run of whitespace (including embedded newlines) with a
// single space and trims both ends.
inline std::string collapse_whitespace(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  bool pending_space = false;
  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.push_back(ch);
  }

  return result;
}

// split_list splits on commas, semicolons and whitespace, dropping empty items.
// Items are returned in encounter order.
inline std::vector<std::string> split_list(const std::string_view input) {
  std::vector<std::string> items;
  std::string current;
  for (const char ch : input) {
    if (ch == ',' || ch == ';' || is_ascii_space(ch)) {
      if (!current.empty()) {
        items.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty()) {
    items.push_back(std::move(current));
  }
  return items;
}

// ascii_fold produces a lowercase ASCII comparison key:
// - LaTeX accent commands (\"o, \'e, \^{a}, \c{c}, ...) keep only their base letter
// - Latin-1 supplement letters in UTF-8 (U+00C0..U+00FF) map to their base letter
// - Braces, backslashes and any other non-ASCII bytes are dropped
// The result is only meant for ordering, never for display.
std::string ascii_fold(std::string_view input);

}  // namespace bibsane::core
