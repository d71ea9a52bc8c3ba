#pragma once

#include <filesystem>
#include <istream>
#include <string_view>

namespace flyguide::dialect {

enum class Delimiter { Comma, Tab };

char delimiterChar(Delimiter delimiter);
std::string_view delimiterName(Delimiter delimiter);

// A line with only one of the two characters selects it. Otherwise the more
// frequent one wins, and ties (including a line with neither) select tab.
Delimiter detectDelimiter(std::string_view first_line);

// Reads the first line of `input` (BOM skipped), detects the delimiter and
// rewinds the stream to its beginning. Throws EmptyInputError when the stream
// holds no line at all.
Delimiter sniffDelimiter(std::istream& input, const std::filesystem::path& source);

}  // namespace flyguide::dialect
