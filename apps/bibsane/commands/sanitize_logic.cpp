#include "sanitize_logic.h"

#include "bibsane/domain/diagnostic.h"
#include "bibsane/domain/diagnostic_json.h"
#include "bibsane/io/output_file.h"
#include "bibsane/pipeline/pipeline.h"

#include <iostream>
#include <utility>

int execute_sanitize(std::vector<bibsane::domain::Entry> entries,
                     const std::optional<std::set<std::string>>& used_keys,
                     const bibsane::config::Config& config,
                     bibsane::lookup::IJournalAbbreviator* abbreviator,
                     const SanitizeOptions& options) {
  using bibsane::domain::DiagnosticSeverity;

  const std::size_t input_count = entries.size();
  const bibsane::pipeline::Pipeline pipeline(config, abbreviator);
  const auto result = pipeline.run(std::move(entries), used_keys);

  for (const auto& diagnostic : result.diagnostics) {
    if (diagnostic.severity == DiagnosticSeverity::kInfo) {
      if (!options.quiet) {
        std::cout << bibsane::domain::format_diagnostic(diagnostic) << "\n";
      }
    } else {
      std::cerr << bibsane::domain::format_diagnostic(diagnostic) << "\n";
    }
  }

  if (!options.quiet) {
    std::cout << "Entries: " << input_count << " in, " << result.entries.size() << " out\n";
    std::cout << "Diagnostics: "
              << bibsane::domain::count_severity(result.diagnostics, DiagnosticSeverity::kError)
              << " error(s), "
              << bibsane::domain::count_severity(result.diagnostics, DiagnosticSeverity::kWarning)
              << " warning(s), "
              << bibsane::domain::count_severity(result.diagnostics, DiagnosticSeverity::kInfo)
              << " info\n";
  }

  int exit_code = result.failed ? kExitBroken : kExitOk;

  auto written = bibsane::io::write_output(options.output_path, result.output_text);
  if (!written.has_value()) {
    std::cerr << "Error: " << written.error() << "\n";
    return kExitInvalid;
  }
  if (!options.quiet) {
    if (written.value() == bibsane::io::WriteStatus::kUnchanged) {
      std::cout << "Unchanged: " << options.output_path << "\n";
    } else {
      std::cout << "Wrote: " << options.output_path << "\n";
    }
  }

  if (options.report_path.has_value()) {
    auto report = bibsane::io::write_output(
        options.report_path.value(), bibsane::domain::diagnostics_to_json_string(result.diagnostics));
    if (!report.has_value()) {
      std::cerr << "Error: " << report.error() << "\n";
      exit_code = kExitInvalid;
    }
  }

  if (result.failed) {
    std::cerr << "Bibliography is broken; fix the errors above.\n";
  }
  return exit_code;
}
