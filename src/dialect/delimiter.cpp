#include "flyguide/dialect/delimiter.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

#include "flyguide/common/errors.hpp"
#include "flyguide/common/text.hpp"

namespace flyguide::dialect {

char delimiterChar(Delimiter delimiter) {
  return delimiter == Delimiter::Tab ? '\t' : ',';
}

std::string_view delimiterName(Delimiter delimiter) {
  return delimiter == Delimiter::Tab ? "tab" : "comma";
}

Delimiter detectDelimiter(std::string_view first_line) {
  const auto tabs = std::count(first_line.begin(), first_line.end(), '\t');
  const auto commas = std::count(first_line.begin(), first_line.end(), ',');
  if (tabs > 0 && commas == 0) {
    return Delimiter::Tab;
  }
  if (commas > 0 && tabs == 0) {
    return Delimiter::Comma;
  }
  return tabs >= commas ? Delimiter::Tab : Delimiter::Comma;
}

Delimiter sniffDelimiter(std::istream& input, const std::filesystem::path& source) {
  std::string line;
  bool terminated = false;
  char ch = 0;
  while (input.get(ch)) {
    if (ch == '\n' || ch == '\r') {
      terminated = true;
      break;
    }
    line.push_back(ch);
  }
  if (input.bad()) {
    throw common::IoError(source, "Failed to read input");
  }

  const auto first_line = common::stripBom(line);
  if (first_line.empty() && !terminated) {
    throw common::EmptyInputError(source);
  }

  const auto delimiter = detectDelimiter(first_line);
  spdlog::debug("Detected {} delimiter in {}", delimiterName(delimiter), source.string());

  input.clear();
  input.seekg(0, std::ios::beg);
  if (!input) {
    throw common::IoError(source, "Failed to rewind input");
  }
  return delimiter;
}

}  // namespace flyguide::dialect
