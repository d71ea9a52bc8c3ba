#include "flyguide/prep/writer.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "flyguide/common/errors.hpp"

namespace flyguide::prep {
namespace {

bool needsQuoting(std::string_view value) {
  return value.find_first_of("\t\"\r\n") != std::string_view::npos;
}

void appendTsvField(std::string& out, std::string_view value) {
  if (!needsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char ch : value) {
    if (ch == '"') {
      out.push_back('"');
    }
    out.push_back(ch);
  }
  out.push_back('"');
}

}  // namespace

OutputPaths outputPathsFor(const std::string& prefix, const OutputSuffixes& suffixes) {
  return OutputPaths{prefix + suffixes.search, prefix + suffixes.kingdom};
}

std::string formatSearchNames(const std::set<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    out.append(name).push_back('\n');
  }
  return out;
}

std::string formatSpeciesKingdom(const std::set<SpeciesKingdom>& pairs) {
  std::string out;
  for (const auto& [species, kingdom] : pairs) {
    appendTsvField(out, species);
    out.push_back('\t');
    appendTsvField(out, kingdom);
    out.push_back('\n');
  }
  return out;
}

void writeWholeFile(const std::filesystem::path& path, std::string_view contents) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output.is_open()) {
    spdlog::error("Failed to open {} for writing", path.string());
    throw common::IoError(path, "Failed to open output for writing");
  }
  output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  output.close();
  if (!output) {
    spdlog::error("Failed to write {}", path.string());
    throw common::IoError(path, "Failed to write output");
  }
}

void writeOutputs(const TaxonSets& sets, const OutputPaths& paths) {
  writeWholeFile(paths.search_names, formatSearchNames(sets.search_names));
  writeWholeFile(paths.species_kingdom, formatSpeciesKingdom(sets.species_kingdom));
}

}  // namespace flyguide::prep
