#include "flyguide/dialect/record_reader.hpp"

#include "flyguide/common/text.hpp"

namespace flyguide::dialect {

RecordReader::RecordReader(std::istream& input, Delimiter delimiter)
    : input_(input), separator_(delimiterChar(delimiter)) {}

void RecordReader::skipBom() {
  bom_checked_ = true;
  char ch = 0;
  while (pending_.size() < common::kUtf8Bom.size() && input_.get(ch)) {
    pending_.push_back(ch);
    if (pending_.back() != common::kUtf8Bom[pending_.size() - 1]) {
      return;
    }
  }
  if (pending_ == common::kUtf8Bom) {
    pending_.clear();
  }
}

bool RecordReader::get(char& ch) {
  if (!bom_checked_) {
    skipBom();
  }
  if (pending_pos_ < pending_.size()) {
    ch = pending_[pending_pos_++];
  } else if (!input_.get(ch)) {
    return false;
  }
  if (ch == '\r') {
    if (pending_pos_ >= pending_.size() && input_.peek() == '\n') {
      input_.get();
    } else if (pending_pos_ < pending_.size() && pending_[pending_pos_] == '\n') {
      ++pending_pos_;
    }
    ch = '\n';
  }
  return true;
}

bool RecordReader::next(std::vector<std::string>& fields) {
  fields.clear();
  std::string field;
  const auto save = [&]() {
    fields.push_back(common::sanitizeUtf8(field));
    field.clear();
  };

  State state = State::StartRecord;
  char ch = 0;
  while (get(ch)) {
    switch (state) {
      case State::StartRecord:
        if (ch == '\n') {
          return true;
        }
        state = State::StartField;
        [[fallthrough]];
      case State::StartField:
        if (ch == '\n') {
          save();
          return true;
        }
        if (ch == '"') {
          state = State::InQuotedField;
        } else if (ch == separator_) {
          save();
        } else {
          field.push_back(ch);
          state = State::InField;
        }
        break;
      case State::InField:
        if (ch == '\n') {
          save();
          return true;
        }
        if (ch == separator_) {
          save();
          state = State::StartField;
        } else {
          field.push_back(ch);
        }
        break;
      case State::InQuotedField:
        if (ch == '"') {
          state = State::QuoteInQuotedField;
        } else {
          field.push_back(ch);
        }
        break;
      case State::QuoteInQuotedField:
        if (ch == '"') {
          field.push_back('"');
          state = State::InQuotedField;
        } else if (ch == separator_) {
          save();
          state = State::StartField;
        } else if (ch == '\n') {
          save();
          return true;
        } else {
          field.push_back(ch);
          state = State::InField;
        }
        break;
    }
  }

  if (state == State::StartRecord) {
    return false;
  }
  // Unterminated last line or quoted field: keep what was read.
  save();
  return true;
}

}  // namespace flyguide::dialect
