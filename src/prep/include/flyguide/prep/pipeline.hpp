#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "flyguide/dialect/delimiter.hpp"
#include "flyguide/prep/config.hpp"
#include "flyguide/prep/writer.hpp"

namespace flyguide::prep {

struct PrepSummary {
  std::size_t rows_read{0};
  std::size_t search_names{0};
  std::size_t species_kingdom_pairs{0};
  dialect::Delimiter delimiter{dialect::Delimiter::Comma};
  OutputPaths outputs;
};

// Reads `input` in one pass and writes the search list and the species/kingdom
// table next to `prefix`. Nothing is written unless the header validates.
PrepSummary runPrep(const std::filesystem::path& input, const std::string& prefix, const PrepConfig& config = {});

std::string formatSummary(const PrepSummary& summary);

}  // namespace flyguide::prep
