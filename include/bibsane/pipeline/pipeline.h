#pragma once

#include "bibsane/config/config.h"
#include "bibsane/domain/diagnostic.h"
#include "bibsane/domain/entry.h"
#include "bibsane/lookup/journal_abbreviator.h"
#include "bibsane/merge/duplicate_resolver.h"
#include "bibsane/normalize/field_normalizer.h"
#include "bibsane/policy/policy_engine.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bibsane::pipeline {

struct PipelineResult {
  std::vector<domain::Entry> entries;  // final entry set, in output order
  std::string output_text;             // rendered bibliography
  domain::Diagnostics diagnostics;     // every pass, in pass order
  bool failed{false};                  // any error diagnostic
};

// Pipeline runs the sanitizer passes in order:
//   policy engine (per entry) -> duplicate resolver -> usage filter -> sort & render
//
// Every pass runs to completion; failure is decided after the last pass. When used_keys is
// nullopt, usage filtering is skipped and every entry counts as cited.
//
// The Config and the optional abbreviator are borrowed and must outlive the pipeline.
class Pipeline {
 public:
  explicit Pipeline(const config::Config& config,
                    lookup::IJournalAbbreviator* abbreviator = nullptr);

  [[nodiscard]] PipelineResult run(std::vector<domain::Entry> entries,
                                   const std::optional<std::set<std::string>>& used_keys) const;

 private:
  const config::Config& config_;
  normalize::FieldNormalizer normalizer_;
  policy::PolicyEngine policy_engine_;
  merge::DuplicateResolver resolver_;
};

}  // namespace bibsane::pipeline
