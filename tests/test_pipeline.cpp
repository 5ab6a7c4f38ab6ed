#include "bibsane/config/config.h"
#include "bibsane/pipeline/pipeline.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <numeric>
#include <set>
#include <string>
#include <vector>

using namespace bibsane;
using namespace bibsane::pipeline;
using domain::DiagnosticKind;
using domain::make_entry;

namespace {

std::vector<domain::Entry> sample_entries() {
  return {
      make_entry("article", "Doe20",
                 {{"author", "Doe, Jane"},
                  {"title", "{A Study}"},
                  {"year", "2020"},
                  {"doi", "https://doi.org/10.1000/ABC"},
                  {"pages", "1-9"}}),
      make_entry("article", "doe2020study",
                 {{"author", "Doe, Jane"},
                  {"year", "2020"},
                  {"doi", "10.1000/abc"},
                  {"journal", "{Nature}"}}),
      make_entry("book", "Roe99", {{"editor", "Roe, Richard"}, {"year", "1999"}}),
      make_entry("misc", "Web", {{"author", "Abel, A."}, {"note", "{Online}"}}),
      make_entry("inproceedings", "Abel20",
                 {{"author", "Abel, A."}, {"year", "2020"}, {"abstract", "Long text"}}),
  };
}

// Simulates writing the output and parsing it back: aliases are not part of the text.
std::vector<domain::Entry> reparse(const std::vector<domain::Entry>& entries) {
  std::vector<domain::Entry> fresh;
  for (const auto& entry : entries) {
    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& field : entry.fields) {
      fields.emplace_back(field.name, field.value);
    }
    fresh.push_back(make_entry(entry.type_name, entry.key, std::move(fields)));
  }
  return fresh;
}

std::set<std::string> keys_of(const std::vector<domain::Entry>& entries) {
  std::set<std::string> keys;
  for (const auto& entry : entries) {
    keys.insert(entry.key);
  }
  return keys;
}

}  // namespace

TEST_CASE("scenario: case-only key collision fails the run", "[pipeline][scenario]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result = pipeline.run(
      {make_entry("article", "Doe20", {{"title", "One"}, {"year", "2020"}}),
       make_entry("article", "doe20", {{"title", "Two"}, {"year", "2020"}})},
      std::set<std::string>{"Doe20", "doe20"});

  REQUIRE(result.entries.size() == 2);
  REQUIRE(domain::count_kind(result.diagnostics, DiagnosticKind::kKeyCollision) == 1);
  REQUIRE(result.failed);
}

TEST_CASE("scenario: agreeing DOI duplicates merge cleanly", "[pipeline][scenario]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result = pipeline.run(
      {make_entry("article", "Doe20",
                  {{"author", "Doe, Jane"}, {"year", "2020"}, {"doi", "10.1000/abc"}}),
       make_entry("article", "Doe20b",
                  {{"author", "Doe, Jane"},
                   {"year", "2020"},
                   {"doi", "10.1000/abc"},
                   {"journal", "{Nature}"}})},
      std::set<std::string>{"Doe20"});

  REQUIRE(result.entries.size() == 1);
  REQUIRE(result.entries[0].get("journal") == "Nature");
  REQUIRE(domain::count_kind(result.diagnostics, DiagnosticKind::kMerged) == 1);
  REQUIRE_FALSE(result.failed);
  REQUIRE(result.output_text.find("journal = {Nature},") != std::string::npos);
}

TEST_CASE("scenario: missing citation fails but output is rendered", "[pipeline][scenario]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result = pipeline.run({make_entry("article", "A", {{"year", "2001"}})},
                                   std::set<std::string>{"A", "B"});

  REQUIRE(result.entries.size() == 1);
  REQUIRE(result.entries[0].key == "A");
  REQUIRE(domain::count_kind(result.diagnostics, DiagnosticKind::kMissingEntry) == 1);
  REQUIRE(result.failed);
  REQUIRE(result.output_text == "@article{A,\n  year = {2001},\n}\n");
}

TEST_CASE("warnings alone do not fail the run", "[pipeline][failure]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result = pipeline.run({make_entry("article", "A", {{"doi", "bogus"}})},
                                   std::set<std::string>{"A"});
  REQUIRE(domain::count_kind(result.diagnostics, DiagnosticKind::kInvalidDoi) == 1);
  REQUIRE_FALSE(result.failed);
}

TEST_CASE("usage filtering is skipped without a key set", "[pipeline][usage]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result = pipeline.run(sample_entries(), std::nullopt);
  REQUIRE(result.entries.size() == 4);
  REQUIRE(domain::count_kind(result.diagnostics, DiagnosticKind::kUnusedEntry) == 0);
}

TEST_CASE("alias citation renames the merged entry", "[pipeline][usage]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result =
      pipeline.run(sample_entries(), std::set<std::string>{"doe2020study", "Roe99"});
  REQUIRE(result.entries.size() == 2);
  REQUIRE(result.output_text.find("@article{doe2020study,") != std::string::npos);
  REQUIRE(result.output_text.find("Doe20,") == std::string::npos);
  REQUIRE_FALSE(result.failed);
}

TEST_CASE("pipeline output is idempotent", "[pipeline][idempotence]") {
  auto config = config::make_default_config();
  config.cruft = {config::FieldRule{std::nullopt, std::nullopt, {"abstract"}}};
  const Pipeline pipeline(config);

  const auto first = pipeline.run(sample_entries(), std::nullopt);
  REQUIRE_FALSE(first.failed);

  const auto second = pipeline.run(reparse(first.entries), keys_of(first.entries));
  REQUIRE(second.output_text == first.output_text);
  REQUIRE_FALSE(second.failed);
}

TEST_CASE("every input permutation renders identically", "[pipeline][determinism]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);
  const auto entries = sample_entries();
  const std::set<std::string> used{"Doe20", "Roe99", "Web", "Abel20"};

  const auto reference = pipeline.run(entries, used).output_text;

  std::vector<std::size_t> order(entries.size());
  std::iota(order.begin(), order.end(), 0);
  while (std::next_permutation(order.begin(), order.end())) {
    std::vector<domain::Entry> permuted;
    for (const auto index : order) {
      permuted.push_back(entries[index]);
    }
    REQUIRE(pipeline.run(std::move(permuted), used).output_text == reference);
  }
}

TEST_CASE("permutations with larger merge groups render identically", "[pipeline][determinism]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);
  const std::vector<domain::Entry> entries{
      make_entry("article", "A", {{"doi", "10.1/x"}, {"year", "2020"}}),
      make_entry("article", "Bee", {{"doi", "10.1/x"}, {"journal", "J"}}),
      make_entry("article", "Cee", {{"doi", "10.1/x"}, {"volume", "3"}}),
      make_entry("article", "X", {{"author", "Doe, J."}, {"year", "2019"}}),
      make_entry("article", "X", {{"year", "2019"}, {"author", "Doe, J."}}),
      make_entry("misc", "Solo", {{"title", "T"}}),
  };
  const std::set<std::string> used{"A", "X", "Solo"};

  const auto reference = pipeline.run(entries, used);
  REQUIRE_FALSE(reference.failed);
  REQUIRE(reference.entries.size() == 3);

  std::vector<std::size_t> order(entries.size());
  std::iota(order.begin(), order.end(), 0);
  while (std::next_permutation(order.begin(), order.end())) {
    std::vector<domain::Entry> permuted;
    for (const auto index : order) {
      permuted.push_back(entries[index]);
    }
    REQUIRE(pipeline.run(std::move(permuted), used).output_text == reference.output_text);
  }
}

TEST_CASE("alias citation never duplicates an existing key", "[pipeline][usage]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);
  std::vector<domain::Entry> entries{
      make_entry("article", "A", {{"doi", "10.1/x"}}),
      make_entry("article", "B", {{"doi", "10.1/x"}}),
      make_entry("book", "B", {{"title", "Other work"}}),
  };

  const auto result = pipeline.run(std::move(entries), std::set<std::string>{"B"});
  REQUIRE(result.failed);
  const auto first = result.output_text.find("{B,");
  REQUIRE(first != std::string::npos);
  REQUIRE(result.output_text.find("{B,", first + 1) == std::string::npos);
}

TEST_CASE("sorted output follows year then author", "[pipeline][sort]") {
  const auto config = config::make_default_config();
  const Pipeline pipeline(config);

  const auto result = pipeline.run(sample_entries(), std::nullopt);
  const auto& text = result.output_text;
  const auto roe = text.find("@book{Roe99,");
  const auto abel = text.find("@inproceedings{Abel20,");
  const auto doe = text.find("@article{Doe20,");
  const auto web = text.find("@misc{Web,");
  REQUIRE(roe < abel);
  REQUIRE(abel < doe);
  REQUIRE(doe < web);
}
