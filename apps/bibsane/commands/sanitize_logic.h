#pragma once

#include "bibsane/config/config.h"
#include "bibsane/domain/entry.h"
#include "bibsane/lookup/journal_abbreviator.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

// Process exit codes of the sanitize command.
constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;  // bad invocation, unreadable input, unwritable output
constexpr int kExitBroken = 2;   // bibliography has error diagnostics

struct SanitizeOptions {
  std::string output_path;
  std::optional<std::string> report_path;
  bool quiet{false};
};

// execute_sanitize: run the pipeline, print diagnostics, write the bibliography and report.
// The output file is written even when the bibliography is broken.
// Takes only interface types; the caller wires the concrete lookup stack.
int execute_sanitize(std::vector<bibsane::domain::Entry> entries,
                     const std::optional<std::set<std::string>>& used_keys,
                     const bibsane::config::Config& config,
                     bibsane::lookup::IJournalAbbreviator* abbreviator,
                     const SanitizeOptions& options);
