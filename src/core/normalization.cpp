#include "bibsane/core/normalization.h"

#include <array>
#include <string>
#include <string_view>

namespace bibsane::core {

namespace {

// Base letters for U+00C0..U+00FF, indexed by (code point - 0xC0).
// Empty entries (multiplication and division signs) are dropped.
constexpr std::array<std::string_view, 64> kLatin1Fold = {
    "a",  "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d",  "n", "o", "o", "o", "o", "o",  "",  "o", "u", "u", "u", "u", "y", "th", "ss",
    "a",  "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d",  "n", "o", "o", "o", "o", "o",  "",  "o", "u", "u", "u", "u", "y", "th", "y",
};

bool is_accent_symbol(const char ch) {
  return ch == '"' || ch == '\'' || ch == '^' || ch == '`' || ch == '~' || ch == '=' ||
         ch == '.';
}

// Letter-named LaTeX commands that stand for a letter rather than an accent.
std::string_view fold_letter_command(const std::string_view name) {
  if (name == "ss") return "ss";
  if (name == "o" || name == "O") return "o";
  if (name == "ae" || name == "AE") return "ae";
  if (name == "oe" || name == "OE") return "oe";
  if (name == "aa" || name == "AA") return "a";
  if (name == "l" || name == "L") return "l";
  if (name == "i") return "i";
  if (name == "j") return "j";
  return "";
}

}  // namespace

std::string ascii_fold(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  std::size_t i = 0;
  while (i < input.size()) {
    const char ch = input[i];
    const auto byte = static_cast<unsigned char>(ch);

    if (ch == '\\') {
      if (i + 1 < input.size() && is_accent_symbol(input[i + 1])) {
        i += 2;
        continue;
      }
      std::size_t name_end = i + 1;
      while (name_end < input.size() && is_ascii_alpha(input[name_end])) {
        ++name_end;
      }
      result.append(fold_letter_command(input.substr(i + 1, name_end - i - 1)));
      i = name_end;
      if (i < input.size() && input[i] == ' ') {
        ++i;
      }
      continue;
    }

    if (ch == '{' || ch == '}') {
      ++i;
      continue;
    }

    if (byte < 0x80) {
      result.push_back(to_ascii_lower(ch));
      ++i;
      continue;
    }

    // Two-byte UTF-8 sequence 0xC3 0x80..0xBF covers U+00C0..U+00FF.
    if (byte == 0xC3 && i + 1 < input.size()) {
      const auto next = static_cast<unsigned char>(input[i + 1]);
      if (next >= 0x80 && next <= 0xBF) {
        result.append(kLatin1Fold[next - 0x80]);
        i += 2;
        continue;
      }
    }

    ++i;
  }

  return result;
}

}  // namespace bibsane::core
