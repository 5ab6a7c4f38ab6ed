#pragma once

#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace bibsane::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure; a failed handler marks the
// parse as invalid but the remaining flags are still processed so every problem is reported.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;
  std::vector<std::string> positional;  // non-flag tokens in order
  bool valid{true};
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Non-flag tokens are collected as positional arguments. Unknown flags and flags
// missing their value are reported to stderr and make the result invalid.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      std::string value;
      if (opt->requires_value) {
        if (i + 1 >= argc) {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.valid = false;
          continue;
        }
        value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      if (!opt->handler(parsed.config, value)) {
        parsed.valid = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.valid = false;
    } else {
      parsed.positional.push_back(std::move(arg));
    }
  }

  return parsed;
}

// print_options writes one aligned help line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    const std::string flag = opt.requires_value ? opt.name + " <value>" : opt.name;
    out << "  " << std::left << std::setw(22) << flag << opt.description << "\n";
  }
}

}  // namespace bibsane::apps
