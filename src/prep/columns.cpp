#include "flyguide/prep/columns.hpp"

#include <optional>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "flyguide/common/errors.hpp"
#include "flyguide/common/text.hpp"

namespace flyguide::prep {
namespace {

using HeaderIndex = std::unordered_map<std::string, std::size_t>;

HeaderIndex buildHeaderIndex(const std::vector<std::string>& header) {
  HeaderIndex index;
  for (std::size_t i = 0; i < header.size(); ++i) {
    const bool inserted = index.insert_or_assign(common::toLowerAscii(header[i]), i).second;
    if (!inserted) {
      spdlog::debug("Header name '{}' repeats; using column {}", header[i], i + 1);
    }
  }
  return index;
}

std::optional<std::size_t> lookup(const HeaderIndex& index,
                                  const std::string& name,
                                  std::vector<std::string>& missing) {
  auto it = index.find(common::toLowerAscii(name));
  if (it == index.end()) {
    missing.push_back(name);
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

ResolvedColumns resolveColumns(const std::vector<std::string>& header, const ColumnNames& names) {
  const auto index = buildHeaderIndex(header);

  std::vector<std::string> missing;
  const auto species = lookup(index, names.species, missing);
  const auto genus = lookup(index, names.genus, missing);
  const auto kingdom = lookup(index, names.kingdom, missing);
  if (!missing.empty()) {
    throw common::MissingColumnsError(std::move(missing), header);
  }

  ResolvedColumns columns;
  columns.species = *species;
  columns.genus = *genus;
  columns.kingdom = *kingdom;
  columns.species_header = header[columns.species];
  columns.genus_header = header[columns.genus];
  columns.kingdom_header = header[columns.kingdom];
  if (columns.species == columns.genus || columns.species == columns.kingdom ||
      columns.genus == columns.kingdom) {
    spdlog::warn("Logical columns share a header column: species='{}' genus='{}' kingdom='{}'",
                 columns.species_header, columns.genus_header, columns.kingdom_header);
  }
  spdlog::debug("Resolved columns species='{}' genus='{}' kingdom='{}'",
                columns.species_header, columns.genus_header, columns.kingdom_header);
  return columns;
}

}  // namespace flyguide::prep
