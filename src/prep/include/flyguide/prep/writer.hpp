#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

#include "flyguide/prep/aggregator.hpp"

namespace flyguide::prep {

struct OutputSuffixes {
  std::string search{"_species_search.txt"};
  std::string kingdom{"_species_kingdom.tsv"};
};

struct OutputPaths {
  std::filesystem::path search_names;
  std::filesystem::path species_kingdom;
};

OutputPaths outputPathsFor(const std::string& prefix, const OutputSuffixes& suffixes = {});

// One name per line, each line terminated by '\n'.
std::string formatSearchNames(const std::set<std::string>& names);

// species<TAB>kingdom per line. Fields holding a tab, quote or line break are
// quoted with embedded quotes doubled, as a minimal-quoting TSV writer does.
std::string formatSpeciesKingdom(const std::set<SpeciesKingdom>& pairs);

// Replaces `path` with `contents` in one write. Throws IoError.
void writeWholeFile(const std::filesystem::path& path, std::string_view contents);

// Writes the search list first, then the pair table. A failure on the second
// file leaves the first one in place.
void writeOutputs(const TaxonSets& sets, const OutputPaths& paths);

}  // namespace flyguide::prep
