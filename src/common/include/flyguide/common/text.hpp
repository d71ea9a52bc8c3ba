#pragma once

#include <string>
#include <string_view>

namespace flyguide::common {

inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
inline constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

std::string_view stripBom(std::string_view text);

// Replaces every maximal invalid UTF-8 subsequence with U+FFFD. Valid input is
// returned unchanged.
std::string sanitizeUtf8(std::string_view text);

// True for the code points Unicode classifies as white space, including the
// ASCII separators 0x1C-0x1F.
bool isUnicodeWhitespace(char32_t code_point);

// Trims white space from both ends. Expects valid UTF-8; trimming stops at the
// first byte that does not decode.
std::string_view trimWhitespace(std::string_view text);

std::string toLowerAscii(std::string_view text);

}  // namespace flyguide::common
