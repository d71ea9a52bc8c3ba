#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "flyguide/dialect/record_reader.hpp"
#include "flyguide/prep/columns.hpp"

namespace flyguide::prep {

using SpeciesKingdom = std::pair<std::string, std::string>;

// Both sets order by byte value, which for UTF-8 is code point order.
struct TaxonSets {
  std::set<std::string> search_names;
  std::set<SpeciesKingdom> species_kingdom;
  std::size_t rows_read{0};
};

class RecordAggregator {
 public:
  explicit RecordAggregator(ResolvedColumns columns);

  // Species names go to the search list and, with a kingdom, to the pair set.
  // Rows without a species fall back to the genus for the search list only.
  void add(const std::vector<std::string>& row);

  const TaxonSets& sets() const { return sets_; }
  TaxonSets release();

 private:
  ResolvedColumns columns_;
  TaxonSets sets_;
};

// Consumes every remaining record of `reader`. Records without any field (blank
// lines) are skipped and not counted.
TaxonSets aggregateRecords(dialect::RecordReader& reader, const ResolvedColumns& columns);

}  // namespace flyguide::prep
