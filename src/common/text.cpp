#include "flyguide/common/text.hpp"

#include <algorithm>
#include <cstddef>

namespace flyguide::common {
namespace {

bool isContinuation(unsigned char byte) {
  return (byte & 0xC0) == 0x80;
}

// Number of bytes of a well-formed sequence starting at `pos`, or the length of
// the maximal invalid prefix (at least one byte) negated.
int sequenceLength(std::string_view text, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    return 1;
  }
  int expected = 0;
  unsigned char lower = 0x80;
  unsigned char upper = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    expected = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    expected = 3;
    if (lead == 0xE0) {
      lower = 0xA0;
    } else if (lead == 0xED) {
      upper = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    expected = 4;
    if (lead == 0xF0) {
      lower = 0x90;
    } else if (lead == 0xF4) {
      upper = 0x8F;
    }
  } else {
    return -1;
  }

  int consumed = 1;
  for (; consumed < expected; ++consumed) {
    if (pos + consumed >= text.size()) {
      return -consumed;
    }
    const auto byte = static_cast<unsigned char>(text[pos + consumed]);
    if (consumed == 1) {
      if (byte < lower || byte > upper) {
        return -consumed;
      }
    } else if (!isContinuation(byte)) {
      return -consumed;
    }
  }
  return expected;
}

char32_t decodeAt(std::string_view text, std::size_t pos, int length) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  char32_t value = 0;
  switch (length) {
    case 1:
      return lead;
    case 2:
      value = lead & 0x1F;
      break;
    case 3:
      value = lead & 0x0F;
      break;
    default:
      value = lead & 0x07;
      break;
  }
  for (int i = 1; i < length; ++i) {
    value = (value << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
  }
  return value;
}

}  // namespace

std::string_view stripBom(std::string_view text) {
  if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
    text.remove_prefix(kUtf8Bom.size());
  }
  return text;
}

std::string sanitizeUtf8(std::string_view text) {
  const bool ascii = std::all_of(text.begin(), text.end(), [](char ch) {
    return static_cast<unsigned char>(ch) < 0x80;
  });
  if (ascii) {
    return std::string(text);
  }

  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const int length = sequenceLength(text, pos);
    if (length > 0) {
      out.append(text.substr(pos, static_cast<std::size_t>(length)));
      pos += static_cast<std::size_t>(length);
    } else {
      out.append(kReplacementCharacter);
      pos += static_cast<std::size_t>(-length);
    }
  }
  return out;
}

bool isUnicodeWhitespace(char32_t code_point) {
  if (code_point <= 0x20) {
    return (code_point >= 0x09 && code_point <= 0x0D) ||
           (code_point >= 0x1C && code_point <= 0x20);
  }
  switch (code_point) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return code_point >= 0x2000 && code_point <= 0x200A;
  }
}

std::string_view trimWhitespace(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size()) {
    const int length = sequenceLength(text, begin);
    if (length <= 0 || !isUnicodeWhitespace(decodeAt(text, begin, length))) {
      break;
    }
    begin += static_cast<std::size_t>(length);
  }

  std::size_t end = text.size();
  while (end > begin) {
    std::size_t start = end - 1;
    while (start > begin && end - start < 4 && isContinuation(static_cast<unsigned char>(text[start]))) {
      --start;
    }
    const int length = sequenceLength(text, start);
    if (length <= 0 || start + static_cast<std::size_t>(length) != end ||
        !isUnicodeWhitespace(decodeAt(text, start, length))) {
      break;
    }
    end = start;
  }
  return text.substr(begin, end - begin);
}

std::string toLowerAscii(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : static_cast<char>(ch);
  });
  return lowered;
}

}  // namespace flyguide::common
