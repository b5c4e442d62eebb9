#pragma once

#include <string>
#include <vector>

namespace processing
{

/// UTF-8 to UTF-32 conversion; stops at the first invalid sequence
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Letters and digits of any script
bool isWordChar(char32_t cp);

/// Unicode whitespace (Zs/Zl/Zp categories plus ASCII control whitespace)
bool isSpaceChar(char32_t cp);

/// Case-folds and NFC-composes text while keeping diacritics ("QUILPUÉ" -> "quilpué").
/// Invalid UTF-8 falls back to ASCII lower-casing.
std::string foldCase(const std::string& text);

/// Removes everything that is neither a word character nor whitespace, then
/// collapses whitespace runs into single spaces and trims both ends.
std::string stripPunctuation(const std::string& text);

/// Splits on whitespace, dropping empty tokens
std::vector<std::string> splitWords(const std::string& text);

/// Joins tokens with a single space
std::string joinWords(const std::vector<std::string>& words);

/// Simple per-codepoint upper-casing ("Ñuñoa" -> "ÑUÑOA")
std::string upperCase(const std::string& text);

/// Upper-cases the first codepoint of every word ("la florida" -> "La Florida")
std::string titleCase(const std::string& text);

} // namespace processing
