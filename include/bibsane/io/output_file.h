#pragma once

#include "bibsane/core/result.h"

#include <string>

namespace bibsane::io {

enum class WriteStatus {
  kWritten,    // file created or replaced
  kUnchanged,  // existing file already had this content; not touched
};

/// Replace the file at `path` with `text` in one step.
/// The text is written to "<path>.tmp" and renamed over the target, so readers never see a
/// partial file. Identical content leaves the file (and its mtime) alone.
[[nodiscard]] core::Result<WriteStatus, std::string> write_output(const std::string& path,
                                                                  const std::string& text);

}  // namespace bibsane::io
