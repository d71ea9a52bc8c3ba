#include "flyguide/prep/aggregator.hpp"

#include <string_view>

#include "flyguide/common/text.hpp"

namespace flyguide::prep {
namespace {

std::string_view field(const std::vector<std::string>& row, std::size_t index) {
  if (index >= row.size()) {
    return {};
  }
  return common::trimWhitespace(row[index]);
}

}  // namespace

RecordAggregator::RecordAggregator(ResolvedColumns columns) : columns_(std::move(columns)) {}

void RecordAggregator::add(const std::vector<std::string>& row) {
  ++sets_.rows_read;
  const auto species = field(row, columns_.species);
  const auto genus = field(row, columns_.genus);
  const auto kingdom = field(row, columns_.kingdom);

  if (!species.empty()) {
    sets_.search_names.emplace(species);
    if (!kingdom.empty()) {
      sets_.species_kingdom.emplace(std::string(species), std::string(kingdom));
    }
  } else if (!genus.empty()) {
    sets_.search_names.emplace(genus);
  }
}

TaxonSets RecordAggregator::release() {
  TaxonSets released = std::move(sets_);
  sets_ = TaxonSets{};
  return released;
}

TaxonSets aggregateRecords(dialect::RecordReader& reader, const ResolvedColumns& columns) {
  RecordAggregator aggregator(columns);
  std::vector<std::string> row;
  while (reader.next(row)) {
    if (row.empty()) {
      continue;
    }
    aggregator.add(row);
  }
  return aggregator.release();
}

}  // namespace flyguide::prep
