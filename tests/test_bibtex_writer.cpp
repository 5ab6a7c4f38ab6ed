#include "bibsane/config/config.h"
#include "bibsane/emit/bibtex_writer.h"

#include <catch2/catch.hpp>

using namespace bibsane;
using namespace bibsane::emit;
using domain::make_entry;

TEST_CASE("render_entry writes the canonical layout", "[emit][writer]") {
  const auto entry =
      make_entry("article", "Doe20", {{"author", "Doe, Jane"}, {"year", "2020"}});
  REQUIRE(render_entry(entry, {}) ==
          "@article{Doe20,\n"
          "  author = {Doe, Jane},\n"
          "  year = {2020},\n"
          "}\n");
}

TEST_CASE("render_entry applies the canonical field order", "[emit][writer]") {
  const auto entry =
      make_entry("article", "K", {{"year", "2020"}, {"note", "n"}, {"author", "A"}});
  REQUIRE(render_entry(entry, {"author", "title", "year"}) ==
          "@article{K,\n"
          "  author = {A},\n"
          "  year = {2020},\n"
          "  note = {n},\n"
          "}\n");
}

TEST_CASE("render_entry keeps the spelling of unknown types and hides aliases",
          "[emit][writer]") {
  auto entry = make_entry("Patent", "P1", {{"title", "T"}});
  entry.aliases = {"P1-old"};
  REQUIRE(render_entry(entry, {}) == "@patent{P1,\n  title = {T},\n}\n");
}

TEST_CASE("render_entry writes preambles", "[emit][writer][preamble]") {
  const auto preamble = make_entry("preamble", "@preamble-0", {{"preamble", "\\def\\x{1}"}});
  REQUIRE(render_entry(preamble, {}) == "@preamble{\"\\def\\x{1}\"}\n");
}

TEST_CASE("render_bibliography separates entries with a blank line", "[emit][writer]") {
  const std::vector<domain::Entry> entries{make_entry("misc", "A", {}),
                                           make_entry("misc", "B", {})};
  REQUIRE(render_bibliography(entries, {}) == "@misc{A,\n}\n\n@misc{B,\n}\n");
  REQUIRE(render_bibliography({}, {}).empty());
}

TEST_CASE("sort_and_render keeps pipeline order when sorting is off", "[emit][writer]") {
  auto config = config::make_default_config();
  config.sort = false;
  std::vector<domain::Entry> entries{make_entry("misc", "B", {{"year", "2020"}}),
                                     make_entry("misc", "A", {{"year", "1990"}})};

  const auto text = sort_and_render(entries, config);
  REQUIRE(text.find("@misc{B,") < text.find("@misc{A,"));

  config.sort = true;
  const auto sorted = sort_and_render(entries, config);
  REQUIRE(sorted.find("@misc{A,") < sorted.find("@misc{B,"));
}
