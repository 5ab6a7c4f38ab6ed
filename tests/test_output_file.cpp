#include "bibsane/io/output_file.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace bibsane::io;
namespace fs = std::filesystem;

namespace {

std::string read_all(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

fs::path scratch_dir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("bibsane_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST_CASE("write_output creates and replaces files", "[io][output]") {
  const auto dir = scratch_dir("write");
  const auto target = (dir / "references.bib").string();

  auto first = write_output(target, "@misc{A,\n}\n");
  REQUIRE(first.has_value());
  REQUIRE(first.value() == WriteStatus::kWritten);
  REQUIRE(read_all(target) == "@misc{A,\n}\n");

  auto second = write_output(target, "@misc{B,\n}\n");
  REQUIRE(second.has_value());
  REQUIRE(second.value() == WriteStatus::kWritten);
  REQUIRE(read_all(target) == "@misc{B,\n}\n");
  REQUIRE_FALSE(fs::exists(target + ".tmp"));

  fs::remove_all(dir);
}

TEST_CASE("write_output leaves identical content alone", "[io][output]") {
  const auto dir = scratch_dir("unchanged");
  const auto target = (dir / "references.bib").string();

  REQUIRE(write_output(target, "same\n").has_value());
  const auto before = fs::last_write_time(target);

  auto again = write_output(target, "same\n");
  REQUIRE(again.has_value());
  REQUIRE(again.value() == WriteStatus::kUnchanged);
  REQUIRE(fs::last_write_time(target) == before);

  fs::remove_all(dir);
}

TEST_CASE("write_output fails for a missing directory", "[io][output]") {
  auto result = write_output("/nonexistent/dir/references.bib", "x");
  REQUIRE_FALSE(result.has_value());
}

TEST_CASE("failed replace removes the temporary file", "[io][output]") {
  const auto dir = scratch_dir("replace_fails");
  const auto target = dir / "references.bib";
  fs::create_directories(target / "occupied");

  auto result = write_output(target.string(), "@misc{A,\n}\n");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().find("Failed to replace") != std::string::npos);
  REQUIRE_FALSE(fs::exists(target.string() + ".tmp"));

  fs::remove_all(dir);
}
