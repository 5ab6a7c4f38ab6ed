#include "bibsane/config/config.h"
#include "bibsane/config/config_loader.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace bibsane::config;
using bibsane::domain::EntryType;

TEST_CASE("default config is the least invasive setting", "[config][defaults]") {
  const auto config = make_default_config();
  REQUIRE_FALSE(config.allowed_types.has_value());
  REQUIRE(config.merge_on_doi);
  REQUIRE(config.merge_on_key);
  REQUIRE(config.allow_preamble);
  REQUIRE(config.normalize_doi);
  REQUIRE(config.normalize_pages);
  REQUIRE_FALSE(config.abbreviate_journals);
  REQUIRE(config.sort);
  REQUIRE(config.marker_field == "bibsane");
  REQUIRE(config.output == "references.bib");
  REQUIRE(validate_config(config).has_value());
}

TEST_CASE("brace exceptions always include author, editor and title", "[config][braces]") {
  Config config;
  config.brace_exceptions.clear();
  REQUIRE(config.is_brace_exception("author"));
  REQUIRE(config.is_brace_exception("editor"));
  REQUIRE(config.is_brace_exception("title"));
  REQUIRE_FALSE(config.is_brace_exception("note"));

  config.brace_exceptions.insert("note");
  REQUIRE(config.is_brace_exception("note"));
}

TEST_CASE("rule_applies matches type and policy tag", "[config][rules]") {
  FieldRule wildcard{std::nullopt, std::nullopt, {"abstract"}};
  FieldRule article_short{EntryType::kArticle, std::string("short"), {"url"}};

  REQUIRE(rule_applies(wildcard, EntryType::kBook, {}));
  REQUIRE(rule_applies(article_short, EntryType::kArticle, {"short", "other"}));
  REQUIRE_FALSE(rule_applies(article_short, EntryType::kArticle, {}));
  REQUIRE_FALSE(rule_applies(article_short, EntryType::kBook, {"short"}));
}

TEST_CASE("empty YAML document yields defaults", "[config][yaml]") {
  const auto result = load_config_yaml("");
  REQUIRE(result.has_value());
  REQUIRE(result.value().merge_on_doi);
  REQUIRE(result.value().cruft.empty());
}

TEST_CASE("YAML document maps every option", "[config][yaml]") {
  const auto result = load_config_yaml(R"(
allowed_types: [article, book, misc]
cruft:
  - type: "*"
    fields: [abstract, File]
  - type: article
    policy: Short
    fields: url
required:
  - type: article
    fields: [journal, year]
brace_exceptions: [note, booktitle]
marker_field: Policy
merge_on_doi: false
allow_preamble: false
abbreviate_journals: true
sort: false
field_order: [author, title, year]
journal_abbreviations:
  Physical Review Letters: Phys. Rev. Lett.
abbreviation_cache: abbrev.db
lookup_timeout_ms: 2500
output: out.bib
)");
  REQUIRE(result.has_value());
  const auto& config = result.value();

  REQUIRE(config.allowed_types.has_value());
  REQUIRE(config.allowed_types->size() == 3);
  REQUIRE(config.allowed_types->count(EntryType::kMisc) == 1);

  REQUIRE(config.cruft.size() == 2);
  REQUIRE_FALSE(config.cruft[0].type.has_value());
  REQUIRE(config.cruft[0].fields == std::vector<std::string>{"abstract", "file"});
  REQUIRE(config.cruft[1].type == EntryType::kArticle);
  REQUIRE(config.cruft[1].policy_tag == "short");
  REQUIRE(config.cruft[1].fields == std::vector<std::string>{"url"});

  REQUIRE(config.required.size() == 1);
  REQUIRE(config.brace_exceptions.count("booktitle") == 1);
  REQUIRE(config.marker_field == "policy");
  REQUIRE_FALSE(config.merge_on_doi);
  REQUIRE(config.merge_on_key);
  REQUIRE_FALSE(config.allow_preamble);
  REQUIRE(config.abbreviate_journals);
  REQUIRE_FALSE(config.sort);
  REQUIRE(config.field_order.size() == 3);
  REQUIRE(config.journal_abbreviations.at("Physical Review Letters") == "Phys. Rev. Lett.");
  REQUIRE(config.abbreviation_cache == "abbrev.db");
  REQUIRE(config.lookup_timeout_ms == 2500);
  REQUIRE(config.output == "out.bib");
}

TEST_CASE("duplicate_doi selects merge, fail or ignore", "[config][yaml][duplicates]") {
  const auto fail = load_config_yaml("duplicate_doi: fail\n");
  REQUIRE(fail.has_value());
  REQUIRE_FALSE(fail.value().merge_on_doi);
  REQUIRE(fail.value().fail_on_duplicate_doi);

  const auto ignore = load_config_yaml("duplicate_doi: Ignore\n");
  REQUIRE(ignore.has_value());
  REQUIRE_FALSE(ignore.value().merge_on_doi);
  REQUIRE_FALSE(ignore.value().fail_on_duplicate_doi);

  const auto merge = load_config_yaml("duplicate_doi: merge\n");
  REQUIRE(merge.has_value());
  REQUIRE(merge.value().merge_on_doi);

  const auto bad = load_config_yaml("duplicate_doi: sometimes\n");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().message.find("duplicate_doi") != std::string::npos);

  const auto both = load_config_yaml("duplicate_doi: fail\nmerge_on_doi: true\n");
  REQUIRE_FALSE(both.has_value());
  REQUIRE(both.error().message.find("mutually exclusive") != std::string::npos);
}

TEST_CASE("allowed_fields rules are read like cruft rules", "[config][yaml][rules]") {
  const auto result = load_config_yaml(R"(
allowed_fields:
  - type: article
    fields: [Author, title, journal, year]
  - type: "*"
    policy: web
    fields: url
)");
  REQUIRE(result.has_value());
  const auto& rules = result.value().allowed_fields;
  REQUIRE(rules.size() == 2);
  REQUIRE(rules[0].type == EntryType::kArticle);
  REQUIRE(rules[0].fields == std::vector<std::string>{"author", "title", "journal", "year"});
  REQUIRE_FALSE(rules[1].type.has_value());
  REQUIRE(rules[1].policy_tag == "web");
}

TEST_CASE("unknown options are rejected by name", "[config][yaml][errors]") {
  const auto result = load_config_yaml("merge_on_doi: true\nmerge_on_title: true\n");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("merge_on_title") != std::string::npos);
}

TEST_CASE("unknown entry types are rejected", "[config][yaml][errors]") {
  const auto result = load_config_yaml("allowed_types: [article, patent]\n");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("patent") != std::string::npos);
}

TEST_CASE("wrong scalar types are reported with the option path", "[config][yaml][errors]") {
  const auto result = load_config_yaml("sort: [yes]\ncruft:\n  - fields: [abstract]\n");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("'sort'") != std::string::npos);
  REQUIRE(result.error().message.find("cruft[0].type") != std::string::npos);
}

TEST_CASE("non-positive lookup timeout fails validation", "[config][yaml][errors]") {
  const auto result = load_config_yaml("lookup_timeout_ms: 0\n");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("lookup_timeout_ms") != std::string::npos);
}

TEST_CASE("malformed YAML is a parse error", "[config][yaml][errors]") {
  const auto result = load_config_yaml("cruft: [unclosed\n");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("YAML parse error") != std::string::npos);
}

TEST_CASE("missing config file is reported", "[config][file]") {
  const auto result = load_config_file("/nonexistent/bibsane.yaml");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().message.find("/nonexistent/bibsane.yaml") != std::string::npos);
}
