#include "bibsane/config/config.h"
#include "bibsane/normalize/field_normalizer.h"

#include <catch2/catch.hpp>

#include <map>
#include <string>

using namespace bibsane;
using namespace bibsane::normalize;
using domain::DiagnosticKind;
using domain::DiagnosticSeverity;

namespace {

class FakeAbbreviator : public lookup::IJournalAbbreviator {
 public:
  explicit FakeAbbreviator(std::map<std::string, std::string> known) : known_(std::move(known)) {}

  lookup::AbbreviationResult abbreviate(const std::string& journal) override {
    ++calls;
    auto it = known_.find(journal);
    if (it == known_.end()) {
      return lookup::AbbreviationResult::err(lookup::LookupError{"timeout for " + journal});
    }
    return lookup::AbbreviationResult::ok(it->second);
  }

  int calls{0};

 private:
  std::map<std::string, std::string> known_;
};

}  // namespace

TEST_CASE("braces_balanced detects unbalanced values", "[normalize][braces]") {
  REQUIRE(braces_balanced("{A} and {B}"));
  REQUIRE(braces_balanced("plain"));
  REQUIRE_FALSE(braces_balanced("{A"));
  REQUIRE_FALSE(braces_balanced("A}"));
  REQUIRE_FALSE(braces_balanced("}A{"));
}

TEST_CASE("strip_enclosing_braces removes value-spanning groups", "[normalize][braces]") {
  REQUIRE(strip_enclosing_braces("{Nature}") == "Nature");
  REQUIRE(strip_enclosing_braces("{{Nature}}") == "Nature");
  REQUIRE(strip_enclosing_braces("  { { Nature } }  ") == "Nature");
}

TEST_CASE("strip_enclosing_braces keeps internal groups", "[normalize][braces]") {
  REQUIRE(strip_enclosing_braces("{DNA} repair") == "{DNA} repair");
  REQUIRE(strip_enclosing_braces("{A} and {B}") == "{A} and {B}");
  REQUIRE(strip_enclosing_braces("{{A} and {B}}") == "{A} and {B}");
}

TEST_CASE("normalize_doi strips resolver prefixes", "[normalize][doi]") {
  REQUIRE(normalize_doi("https://doi.org/10.1000/ABC").value == "10.1000/abc");
  REQUIRE(normalize_doi("http://dx.doi.org/10.1000/abc").value == "10.1000/abc");
  REQUIRE(normalize_doi("DOI:10.1000/abc").value == "10.1000/abc");
  REQUIRE(normalize_doi("https://proxy.example.edu/login/10.1000/abc").value == "10.1000/abc");
  REQUIRE(normalize_doi("10.1000/abc").valid);
}

TEST_CASE("normalize_doi flags non-conforming values", "[normalize][doi]") {
  REQUIRE_FALSE(normalize_doi("abc/123").valid);
  REQUIRE_FALSE(normalize_doi("10.1000").valid);
  REQUIRE_FALSE(normalize_doi("10.1000/").valid);
  REQUIRE(doi_merge_key("https://doi.org/10.1000/ABC") == doi_merge_key("10.1000/abc"));
}

TEST_CASE("normalize_pages canonicalizes simple ranges", "[normalize][pages]") {
  REQUIRE(normalize_pages("12-15").value == "12--15");
  REQUIRE(normalize_pages("12-15").status == PagesStatus::kNormalized);
  REQUIRE(normalize_pages("12 \xE2\x80\x93 15").value == "12--15");
  REQUIRE(normalize_pages("12 -- 15").value == "12--15");
  REQUIRE(normalize_pages("12--15").status == PagesStatus::kUnchanged);
}

TEST_CASE("normalize_pages leaves single pages and lists alone", "[normalize][pages]") {
  REQUIRE(normalize_pages("42").status == PagesStatus::kUnchanged);
  REQUIRE(normalize_pages("1, 3, 5").status == PagesStatus::kUnchanged);
  REQUIRE(normalize_pages("e1234").value == "e1234");
}

TEST_CASE("normalize_pages flags irregular separators", "[normalize][pages]") {
  REQUIRE(normalize_pages("12---15").status == PagesStatus::kIrregular);
  REQUIRE(normalize_pages("12-15-18").status == PagesStatus::kIrregular);
  REQUIRE(normalize_pages("-15").status == PagesStatus::kIrregular);
  REQUIRE(normalize_pages("12-15-18").value == "12-15-18");
}

TEST_CASE("FieldNormalizer strips braces except for exception fields", "[normalize][field]") {
  const auto config = config::make_default_config();
  const FieldNormalizer normalizer(config);

  REQUIRE(normalizer.normalize_field("K", "journal", "{Nature}").value == "Nature");
  REQUIRE(normalizer.normalize_field("K", "title", "{Nature}").value == "{Nature}");
  REQUIRE(normalizer.normalize_field("K", "author", "{ACME Corp}").value == "{ACME Corp}");
  REQUIRE(normalizer.normalize_field("K", "note", "{Keep}").value == "{Keep}");
}

TEST_CASE("FieldNormalizer collapses whitespace", "[normalize][field]") {
  const auto config = config::make_default_config();
  const FieldNormalizer normalizer(config);

  const auto result = normalizer.normalize_field("K", "title", "  A\n  long\ttitle ");
  REQUIRE(result.value == "A long title");
  REQUIRE(result.diagnostics.empty());
}

TEST_CASE("FieldNormalizer reports unbalanced braces and keeps the value", "[normalize][field]") {
  const auto config = config::make_default_config();
  const FieldNormalizer normalizer(config);

  const auto result = normalizer.normalize_field("Doe20", "journal", "{Nature  ");
  REQUIRE(result.value == "{Nature  ");
  REQUIRE(result.diagnostics.size() == 1);
  REQUIRE(result.diagnostics[0].kind == DiagnosticKind::kParseHazard);
  REQUIRE(result.diagnostics[0].severity == DiagnosticSeverity::kError);
  REQUIRE(result.diagnostics[0].entry_key == "Doe20");
  REQUIRE(result.diagnostics[0].field == "journal");
}

TEST_CASE("FieldNormalizer normalizes DOIs and warns on bad ones", "[normalize][field][doi]") {
  const auto config = config::make_default_config();
  const FieldNormalizer normalizer(config);

  const auto good = normalizer.normalize_field("K", "doi", "https://doi.org/10.1000/ABC");
  REQUIRE(good.value == "10.1000/abc");
  REQUIRE(good.diagnostics.empty());

  const auto bad = normalizer.normalize_field("K", "doi", "not-a-doi");
  REQUIRE(bad.value == "not-a-doi");
  REQUIRE(bad.diagnostics.size() == 1);
  REQUIRE(bad.diagnostics[0].kind == DiagnosticKind::kInvalidDoi);
  REQUIRE(bad.diagnostics[0].severity == DiagnosticSeverity::kWarning);
}

TEST_CASE("FieldNormalizer respects disabled toggles", "[normalize][field]") {
  auto config = config::make_default_config();
  config.normalize_doi = false;
  config.normalize_pages = false;
  const FieldNormalizer normalizer(config);

  REQUIRE(normalizer.normalize_field("K", "doi", "DOI:10.1/X").value == "DOI:10.1/X");
  REQUIRE(normalizer.normalize_field("K", "pages", "1-2").value == "1-2");
}

TEST_CASE("FieldNormalizer warns on irregular pages", "[normalize][field][pages]") {
  const auto config = config::make_default_config();
  const FieldNormalizer normalizer(config);

  const auto result = normalizer.normalize_field("K", "pages", "1-2-3");
  REQUIRE(result.value == "1-2-3");
  REQUIRE(result.diagnostics.size() == 1);
  REQUIRE(result.diagnostics[0].kind == DiagnosticKind::kIrregularPages);
}

TEST_CASE("FieldNormalizer abbreviates journals through the service", "[normalize][journal]") {
  auto config = config::make_default_config();
  config.abbreviate_journals = true;
  FakeAbbreviator abbreviator(std::map<std::string, std::string>{{"Physical Review Letters", "Phys. Rev. Lett."}});
  const FieldNormalizer normalizer(config, &abbreviator);

  const auto result = normalizer.normalize_field("K", "journal", "{Physical Review Letters}");
  REQUIRE(result.value == "Phys. Rev. Lett.");
  REQUIRE(result.diagnostics.empty());

  // Already abbreviated names are not looked up again
  const auto again = normalizer.normalize_field("K", "journal", "Phys. Rev. Lett.");
  REQUIRE(again.value == "Phys. Rev. Lett.");
  REQUIRE(abbreviator.calls == 1);
}

TEST_CASE("lookup failure degrades to a warning", "[normalize][journal]") {
  auto config = config::make_default_config();
  config.abbreviate_journals = true;
  FakeAbbreviator abbreviator(std::map<std::string, std::string>{});
  const FieldNormalizer normalizer(config, &abbreviator);

  const auto result = normalizer.normalize_field("Doe20", "journal", "Nature");
  REQUIRE(result.value == "Nature");
  REQUIRE(result.diagnostics.size() == 1);
  REQUIRE(result.diagnostics[0].kind == DiagnosticKind::kLookupDegradation);
  REQUIRE(result.diagnostics[0].severity == DiagnosticSeverity::kWarning);
  REQUIRE_FALSE(domain::has_errors(result.diagnostics));
}

TEST_CASE("journal lookup is skipped when abbreviation is disabled", "[normalize][journal]") {
  const auto config = config::make_default_config();
  FakeAbbreviator abbreviator(std::map<std::string, std::string>{{"Nature", "Nat."}});
  const FieldNormalizer normalizer(config, &abbreviator);

  REQUIRE(normalizer.normalize_field("K", "journal", "Nature").value == "Nature");
  REQUIRE(abbreviator.calls == 0);
}
