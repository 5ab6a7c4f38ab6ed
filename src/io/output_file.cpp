#include "bibsane/io/output_file.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace bibsane::io {

namespace fs = std::filesystem;

namespace {

// Best effort: a leftover temp file is harmless and overwritten by the next run.
void discard_temp(const std::string& temp_path) {
  std::error_code ignored;
  fs::remove(temp_path, ignored);
}

}  // namespace

core::Result<WriteStatus, std::string> write_output(const std::string& path,
                                                    const std::string& text) {
  using WriteResult = core::Result<WriteStatus, std::string>;

  {
    std::ifstream existing(path, std::ios::binary);
    if (existing.is_open()) {
      std::ostringstream buffer;
      buffer << existing.rdbuf();
      if (buffer.str() == text) {
        return WriteResult::ok(WriteStatus::kUnchanged);
      }
    }
  }

  const std::string temp_path = path + ".tmp";
  bool written = false;
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return WriteResult::err("Failed to open for writing: " + temp_path);
    }
    out << text;
    out.flush();
    written = static_cast<bool>(out);
  }
  if (!written) {
    discard_temp(temp_path);
    return WriteResult::err("Failed to write: " + temp_path);
  }

  std::error_code ec;
  fs::rename(temp_path, path, ec);
  if (ec) {
    discard_temp(temp_path);
    return WriteResult::err("Failed to replace " + path + ": " + ec.message());
  }
  return WriteResult::ok(WriteStatus::kWritten);
}

}  // namespace bibsane::io
