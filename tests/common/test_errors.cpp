#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include "flyguide/common/errors.hpp"

using namespace flyguide::common;

TEST_CASE("formatNameList renders a bracketed quoted list") {
  CHECK(formatNameList({}) == "[]");
  CHECK(formatNameList({"species"}) == "['species']");
  CHECK(formatNameList({"taxon", "genus", "kingdom"}) == "['taxon', 'genus', 'kingdom']");
}

TEST_CASE("missing column errors carry missing and found names") {
  MissingColumnsError error({"species"}, {"taxon", "genus", "kingdom"});
  CHECK(error.missing() == std::vector<std::string>{"species"});
  CHECK(error.found().size() == 3);
  const std::string message = error.what();
  CHECK(message.find("Missing: ['species']") != std::string::npos);
  CHECK(message.find("Found: ['taxon', 'genus', 'kingdom']") != std::string::npos);
}

TEST_CASE("path carrying errors name the path") {
  InputNotFoundError not_found("/tmp/absent.csv");
  CHECK(std::string(not_found.what()) == "Input file not found: /tmp/absent.csv");
  CHECK(not_found.path() == "/tmp/absent.csv");

  EmptyInputError empty("empty.tsv");
  CHECK(std::string(empty.what()).find("empty.tsv") != std::string::npos);

  IoError io("out_species_search.txt", "Failed to write output");
  CHECK(std::string(io.what()) == "Failed to write output: out_species_search.txt");
}

TEST_CASE("all prep errors share one base") {
  CHECK_THROWS_AS(throw UsageError("usage"), PrepError);
  CHECK_THROWS_AS(throw ConfigError("config"), PrepError);
  CHECK_THROWS_AS(throw EmptyInputError("x"), std::runtime_error);
}
