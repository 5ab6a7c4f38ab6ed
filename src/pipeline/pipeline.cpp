#include "bibsane/pipeline/pipeline.h"

#include "bibsane/emit/bibtex_writer.h"
#include "bibsane/usage/usage_filter.h"

#include <utility>

namespace bibsane::pipeline {

Pipeline::Pipeline(const config::Config& config, lookup::IJournalAbbreviator* abbreviator)
    : config_(config),
      normalizer_(config, abbreviator),
      policy_engine_(config, normalizer_),
      resolver_(config) {}

PipelineResult Pipeline::run(std::vector<domain::Entry> entries,
                             const std::optional<std::set<std::string>>& used_keys) const {
  PipelineResult result;

  // 1. Entry-local policies
  std::vector<domain::Entry> admitted;
  admitted.reserve(entries.size());
  for (auto& entry : entries) {
    auto outcome = policy_engine_.apply_policies(std::move(entry));
    domain::append(result.diagnostics, std::move(outcome.diagnostics));
    if (outcome.entry.has_value()) {
      admitted.push_back(std::move(outcome.entry.value()));
    }
  }

  // 2. Duplicates
  auto merged = resolver_.resolve_duplicates(std::move(admitted));
  domain::append(result.diagnostics, std::move(merged.diagnostics));

  // 3. Citations
  if (used_keys.has_value()) {
    auto used = usage::filter_by_usage(std::move(merged.entries), used_keys.value());
    domain::append(result.diagnostics, std::move(used.diagnostics));
    result.entries = std::move(used.entries);
  } else {
    result.entries = std::move(merged.entries);
  }

  // 4. Output
  result.output_text = emit::sort_and_render(result.entries, config_);
  result.failed = domain::has_errors(result.diagnostics);
  return result;
}

}  // namespace bibsane::pipeline
