#pragma once

#include "bibsane/config/config.h"
#include "bibsane/domain/entry.h"

#include <string>
#include <vector>

namespace bibsane::emit {

// render_entry writes one entry in canonical form:
//
//   @article{Doe20,
//     author = {Doe, Jane},
//     year = {2020},
//   }
//
// Fields named in field_order come first (in that order), the rest in encounter order.
// Preambles render as @preamble{"..."}. Aliases are never written.
[[nodiscard]] std::string render_entry(const domain::Entry& entry,
                                       const std::vector<std::string>& field_order);

// render_bibliography joins rendered entries with one blank line; empty input gives "".
[[nodiscard]] std::string render_bibliography(const std::vector<domain::Entry>& entries,
                                              const std::vector<std::string>& field_order);

// sort_and_render sorts (when config.sort is set) and renders the final entry set.
[[nodiscard]] std::string sort_and_render(std::vector<domain::Entry>& entries,
                                          const config::Config& config);

}  // namespace bibsane::emit
