#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <filesystem>
#include <set>
#include <string>

#include "flyguide/common/errors.hpp"
#include "flyguide/prep/writer.hpp"
#include "support/test_data_factory.hpp"

using flyguide::prep::SpeciesKingdom;
using flyguide::tests::support::readFile;
using flyguide::tests::support::TempDir;

TEST_CASE("output paths append the suffixes to the prefix") {
  auto paths = flyguide::prep::outputPathsFor("run/mayfly");
  CHECK(paths.search_names == std::filesystem::path("run/mayfly_species_search.txt"));
  CHECK(paths.species_kingdom == std::filesystem::path("run/mayfly_species_kingdom.tsv"));

  flyguide::prep::OutputSuffixes suffixes;
  suffixes.search = ".names";
  suffixes.kingdom = ".kingdoms";
  auto custom = flyguide::prep::outputPathsFor("out", suffixes);
  CHECK(custom.search_names == std::filesystem::path("out.names"));
  CHECK(custom.species_kingdom == std::filesystem::path("out.kingdoms"));
}

TEST_CASE("search names are written in code point order") {
  const std::set<std::string> names{"quercus", "Quercus robur", "Abies", "\xC3\x84sculus", "Zea mays"};
  CHECK(flyguide::prep::formatSearchNames(names) ==
        "Abies\nQuercus robur\nZea mays\nquercus\n\xC3\x84sculus\n");
  CHECK(flyguide::prep::formatSearchNames({}).empty());
}

TEST_CASE("species kingdom rows sort by species then kingdom") {
  const std::set<SpeciesKingdom> pairs{
      {"Panthera leo", "Animalia"},
      {"Euglena gracilis", "Protozoa"},
      {"Euglena gracilis", "Chromista"},
  };
  CHECK(flyguide::prep::formatSpeciesKingdom(pairs) ==
        "Euglena gracilis\tChromista\n"
        "Euglena gracilis\tProtozoa\n"
        "Panthera leo\tAnimalia\n");
}

TEST_CASE("species kingdom fields with separators are quoted") {
  const std::set<SpeciesKingdom> pairs{{"Odd\tname", "say \"hi\""}, {"multi\nline", "Plantae"}};
  CHECK(flyguide::prep::formatSpeciesKingdom(pairs) ==
        "\"Odd\tname\"\t\"say \"\"hi\"\"\"\n"
        "\"multi\nline\"\tPlantae\n");
}

TEST_CASE("writeOutputs replaces both files") {
  TempDir dir;
  flyguide::prep::TaxonSets sets;
  sets.search_names = {"Panthera leo", "Quercus"};
  sets.species_kingdom.emplace("Panthera leo", "Animalia");
  auto paths = flyguide::prep::outputPathsFor((dir.path / "gbif").string());

  flyguide::tests::support::writeFile(paths.search_names, "stale contents that are longer\n");
  flyguide::prep::writeOutputs(sets, paths);
  CHECK(readFile(paths.search_names) == "Panthera leo\nQuercus\n");
  CHECK(readFile(paths.species_kingdom) == "Panthera leo\tAnimalia\n");
}

TEST_CASE("write failures raise IoError") {
  TempDir dir;
  auto missing_dir = dir.path / "does-not-exist" / "out.txt";
  CHECK_THROWS_AS(flyguide::prep::writeWholeFile(missing_dir, "x\n"), flyguide::common::IoError);
}

TEST_CASE("a failing second write leaves the first file in place") {
  TempDir dir;
  flyguide::prep::TaxonSets sets;
  sets.search_names.insert("Quercus");
  flyguide::prep::OutputPaths paths{dir.path / "names.txt", dir.path / "missing" / "pairs.tsv"};
  CHECK_THROWS_AS(flyguide::prep::writeOutputs(sets, paths), flyguide::common::IoError);
  CHECK(readFile(paths.search_names) == "Quercus\n");
}
