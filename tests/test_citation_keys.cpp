#include "bibsane/io/citation_keys.h"

#include <catch2/catch.hpp>

using namespace bibsane::io;

TEST_CASE("parse_citation_keys splits lines and commas", "[io][citation_keys]") {
  const auto keys = parse_citation_keys("Doe20,Roe99\n  Abel20  \n\nDoe20\n");
  REQUIRE(keys == std::set<std::string>{"Abel20", "Doe20", "Roe99"});
}

TEST_CASE("parse_citation_keys ignores comments", "[io][citation_keys]") {
  const auto keys = parse_citation_keys("# cited in chapter 1\nA, B # trailing\n#C\n");
  REQUIRE(keys == std::set<std::string>{"A", "B"});
}

TEST_CASE("parse_citation_keys keeps case", "[io][citation_keys]") {
  const auto keys = parse_citation_keys("Doe20 doe20");
  REQUIRE(keys.size() == 2);
}

TEST_CASE("read_citation_keys_file reports missing files", "[io][citation_keys][file]") {
  const auto result = read_citation_keys_file("/nonexistent/keys.txt");
  REQUIRE_FALSE(result.has_value());
}
