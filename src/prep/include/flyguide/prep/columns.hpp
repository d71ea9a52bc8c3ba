#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace flyguide::prep {

// Header names looked up (case-insensitively) for each logical column.
struct ColumnNames {
  std::string species{"species"};
  std::string genus{"genus"};
  std::string kingdom{"kingdom"};
};

// Positions of the logical columns within a header, plus the header spelling
// that matched.
struct ResolvedColumns {
  std::size_t species{0};
  std::size_t genus{0};
  std::size_t kingdom{0};
  std::string species_header;
  std::string genus_header;
  std::string kingdom_header;
};

// Throws MissingColumnsError listing every absent name together with the header
// as found. When a name occurs more than once, the last occurrence wins.
ResolvedColumns resolveColumns(const std::vector<std::string>& header, const ColumnNames& names = {});

}  // namespace flyguide::prep
