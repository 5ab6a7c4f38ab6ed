#include "bibsane/io/citation_keys.h"

#include "bibsane/core/normalization.h"

#include <fstream>
#include <sstream>

namespace bibsane::io {

std::set<std::string> parse_citation_keys(const std::string& text) {
  std::set<std::string> keys;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    const auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    std::string current;
    for (const char ch : line) {
      if (ch == ',' || core::is_ascii_space(ch)) {
        if (!current.empty()) {
          keys.insert(current);
          current.clear();
        }
      } else {
        current.push_back(ch);
      }
    }
    if (!current.empty()) {
      keys.insert(current);
    }
  }
  return keys;
}

core::Result<std::set<std::string>, std::string> read_citation_keys_file(
    const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return core::Result<std::set<std::string>, std::string>::err(
        "Failed to open citation key file: " + path);
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return core::Result<std::set<std::string>, std::string>::ok(parse_citation_keys(buffer.str()));
}

}  // namespace bibsane::io
