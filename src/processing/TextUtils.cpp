#include "TextUtils.hpp"
#include <utf8proc.h>
#include <plog/Log.h>

#include <cctype>
#include <cstdlib>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            break;
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isWordChar(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

bool isSpaceChar(char32_t cp)
{
    if (cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\v' || cp == U'\f')
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::string foldCase(const std::string& text)
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* folded = nullptr;
    const auto options = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_CASEFOLD);
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &folded, options);
    if (len < 0 || !folded)
    {
        PLOG_WARNING << "Case folding failed (" << utf8proc_errmsg(len) << "), using ASCII lower-case";
        std::string lower;
        lower.reserve(text.size());
        for (char c : text)
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return lower;
    }

    std::string result(reinterpret_cast<char*>(folded), static_cast<std::size_t>(len));
    std::free(folded);
    return result;
}

std::string stripPunctuation(const std::string& text)
{
    std::u32string cleaned;
    bool pending_space = false;
    for (char32_t cp : utf8ToUtf32(text))
    {
        if (isSpaceChar(cp))
        {
            pending_space = !cleaned.empty();
            continue;
        }
        if (!isWordChar(cp))
            continue;
        if (pending_space)
        {
            cleaned.push_back(U' ');
            pending_space = false;
        }
        cleaned.push_back(cp);
    }
    return utf32ToUtf8(cleaned);
}

std::vector<std::string> splitWords(const std::string& text)
{
    std::vector<std::string> words;
    std::string current;
    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (!current.empty())
            {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty())
        words.push_back(std::move(current));
    return words;
}

std::string joinWords(const std::vector<std::string>& words)
{
    std::string out;
    for (const auto& word : words)
    {
        if (!out.empty())
            out.push_back(' ');
        out += word;
    }
    return out;
}

std::string upperCase(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    for (auto& cp : cps)
        cp = static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cp)));
    return utf32ToUtf8(cps);
}

std::string titleCase(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    bool word_start = true;
    for (auto& cp : cps)
    {
        if (isSpaceChar(cp))
        {
            word_start = true;
            continue;
        }
        if (word_start)
        {
            cp = static_cast<char32_t>(utf8proc_totitle(static_cast<utf8proc_int32_t>(cp)));
            word_start = false;
        }
    }
    return utf32ToUtf8(cps);
}

} // namespace processing
