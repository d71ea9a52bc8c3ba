#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "flyguide/common/errors.hpp"
#include "flyguide/prep/columns.hpp"

using flyguide::common::MissingColumnsError;
using flyguide::prep::ColumnNames;
using flyguide::prep::resolveColumns;
using Header = std::vector<std::string>;

TEST_CASE("columns resolve case-insensitively to header positions") {
  const Header header{"gbifID", "Kingdom", "GENUS", "species", "countryCode"};
  auto columns = resolveColumns(header);
  CHECK(columns.species == 3);
  CHECK(columns.genus == 2);
  CHECK(columns.kingdom == 1);
  CHECK(columns.species_header == "species");
  CHECK(columns.genus_header == "GENUS");
  CHECK(columns.kingdom_header == "Kingdom");
}

TEST_CASE("missing columns are reported with the header as found") {
  const Header header{"taxon", "genus", "kingdom"};
  try {
    resolveColumns(header);
    FAIL("expected MissingColumnsError");
  } catch (const MissingColumnsError& ex) {
    CHECK(ex.missing() == Header{"species"});
    CHECK(ex.found() == header);
  }
}

TEST_CASE("every absent column is listed in required order") {
  try {
    resolveColumns({"scientificName"});
    FAIL("expected MissingColumnsError");
  } catch (const MissingColumnsError& ex) {
    CHECK(ex.missing() == Header{"species", "genus", "kingdom"});
    CHECK(ex.found() == Header{"scientificName"});
  }
  CHECK_THROWS_AS(resolveColumns({}), MissingColumnsError);
}

TEST_CASE("the last of repeated header names wins") {
  auto columns = resolveColumns({"species", "genus", "Species", "kingdom"});
  CHECK(columns.species == 2);
  CHECK(columns.species_header == "Species");
}

TEST_CASE("configured header names replace the logical defaults") {
  ColumnNames names;
  names.species = "verbatimScientificName";
  auto columns = resolveColumns({"VerbatimScientificName", "genus", "kingdom", "species"}, names);
  CHECK(columns.species == 0);

  try {
    resolveColumns({"species", "genus", "kingdom"}, names);
    FAIL("expected MissingColumnsError");
  } catch (const MissingColumnsError& ex) {
    CHECK(ex.missing() == Header{"verbatimScientificName"});
  }
}
