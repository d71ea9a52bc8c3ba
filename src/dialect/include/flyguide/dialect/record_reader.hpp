#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "flyguide/dialect/delimiter.hpp"

namespace flyguide::dialect {

// Tokenizes delimited text record by record. Follows the usual spreadsheet CSV
// conventions: a field that starts with a double quote is quoted, "" inside it is
// a literal quote, and delimiters or line breaks inside quotes are data. Quoting
// errors are tolerated rather than reported. CRLF and lone CR line endings read
// as LF. A leading UTF-8 BOM is skipped and every field is returned as valid
// UTF-8 (invalid bytes become U+FFFD).
class RecordReader {
 public:
  RecordReader(std::istream& input, Delimiter delimiter);

  // Reads the next record into `fields`. Returns false at end of input. A blank
  // line produces a record with no fields.
  bool next(std::vector<std::string>& fields);

 private:
  enum class State { StartRecord, StartField, InField, InQuotedField, QuoteInQuotedField };

  bool get(char& ch);
  void skipBom();

  std::istream& input_;
  char separator_;
  std::string pending_;
  std::size_t pending_pos_{0};
  bool bom_checked_{false};
};

}  // namespace flyguide::dialect
