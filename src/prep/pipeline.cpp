#include "flyguide/prep/pipeline.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "flyguide/common/errors.hpp"
#include "flyguide/dialect/record_reader.hpp"
#include "flyguide/prep/aggregator.hpp"
#include "flyguide/prep/columns.hpp"

namespace flyguide::prep {
namespace {

struct ReadResult {
  TaxonSets sets;
  dialect::Delimiter delimiter;
};

ReadResult readInput(const std::filesystem::path& input, const ColumnNames& names) {
  std::ifstream stream(input, std::ios::binary);
  if (!stream.is_open()) {
    throw common::InputNotFoundError(input);
  }

  const auto delimiter = dialect::sniffDelimiter(stream, input);
  dialect::RecordReader reader(stream, delimiter);

  std::vector<std::string> header;
  if (!reader.next(header)) {
    throw common::EmptyInputError(input);
  }
  const auto columns = resolveColumns(header, names);

  auto sets = aggregateRecords(reader, columns);
  if (stream.bad()) {
    throw common::IoError(input, "Failed to read input");
  }
  return ReadResult{std::move(sets), delimiter};
}

}  // namespace

PrepSummary runPrep(const std::filesystem::path& input, const std::string& prefix, const PrepConfig& config) {
  std::error_code ec;
  if (!std::filesystem::exists(input, ec)) {
    throw common::InputNotFoundError(input);
  }

  auto [sets, delimiter] = readInput(input, config.columns);

  PrepSummary summary;
  summary.rows_read = sets.rows_read;
  summary.search_names = sets.search_names.size();
  summary.species_kingdom_pairs = sets.species_kingdom.size();
  summary.delimiter = delimiter;
  summary.outputs = outputPathsFor(prefix, config.outputs);

  writeOutputs(sets, summary.outputs);
  return summary;
}

std::string formatSummary(const PrepSummary& summary) {
  std::ostringstream stream;
  stream << "GBIF prep complete.\n"
         << "  Rows read from GBIF file : " << summary.rows_read << '\n'
         << "  Delimiter                : " << dialect::delimiterName(summary.delimiter) << '\n'
         << "  Unique names for search  : " << summary.search_names << " -> "
         << summary.outputs.search_names.string() << '\n'
         << "  Unique species/kingdom   : " << summary.species_kingdom_pairs << " -> "
         << summary.outputs.species_kingdom.string();
  return stream.str();
}

}  // namespace flyguide::prep
