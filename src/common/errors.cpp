#include "flyguide/common/errors.hpp"

#include <utility>

namespace flyguide::common {

InputNotFoundError::InputNotFoundError(std::filesystem::path path)
    : PrepError("Input file not found: " + path.string()), path_(std::move(path)) {}

EmptyInputError::EmptyInputError(std::filesystem::path path)
    : PrepError("Input file appears to be empty: " + path.string()), path_(std::move(path)) {}

MissingColumnsError::MissingColumnsError(std::vector<std::string> missing, std::vector<std::string> found)
    : PrepError("GBIF file must contain columns named 'species', 'genus', and 'kingdom' (case-insensitive). "
                "Missing: " + formatNameList(missing) + " Found: " + formatNameList(found)),
      missing_(std::move(missing)),
      found_(std::move(found)) {}

IoError::IoError(std::filesystem::path path, const std::string& what)
    : PrepError(what + ": " + path.string()), path_(std::move(path)) {}

std::string formatNameList(const std::vector<std::string>& names) {
  std::string out = "[";
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      out.append(", ");
    }
    out.append("'").append(names[i]).append("'");
  }
  out.append("]");
  return out;
}

}  // namespace flyguide::common
