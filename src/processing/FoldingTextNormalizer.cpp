#include "FoldingTextNormalizer.hpp"
#include "TextUtils.hpp"

#include <utf8proc.h>
#include <plog/Log.h>

#include <cctype>
#include <cstdlib>

namespace processing
{

namespace
{

// Returns false when utf8proc rejects the input (invalid UTF-8)
bool mapUtf8(const std::string& text, utf8proc_option_t options, std::string& out)
{
    utf8proc_uint8_t* mapped = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &mapped, options);
    if (len < 0 || !mapped)
    {
        PLOG_WARNING << "utf8proc_map failed: " << utf8proc_errmsg(len);
        return false;
    }

    out.assign(reinterpret_cast<char*>(mapped), static_cast<std::size_t>(len));
    std::free(mapped);
    return true;
}

} // namespace

std::string FoldingTextNormalizer::stripAccents(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string stripped;
    const auto options =
        static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_DECOMPOSE | UTF8PROC_STRIPMARK | UTF8PROC_COMPOSE);
    if (!mapUtf8(text, options, stripped))
        return text;
    return stripped;
}

std::string FoldingTextNormalizer::normalizeText(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string folded;
    const auto options = static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPAT | UTF8PROC_DECOMPOSE |
                                                        UTF8PROC_STRIPMARK | UTF8PROC_CASEFOLD);
    if (!mapUtf8(text, options, folded))
    {
        PLOG_WARNING << "Invalid UTF-8 in input, falling back to ASCII fold";
        return asciiFold(text);
    }

    return stripPunctuation(folded);
}

NormalizedQuery FoldingTextNormalizer::normalize(const std::string& text) const
{
    return NormalizedQuery{ text, normalizeText(text) };
}

std::string FoldingTextNormalizer::asciiFold(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char ch : text)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (c >= 0x80)
            continue;
        if (std::isspace(c))
        {
            pending_space = !out.empty();
            continue;
        }
        if (!std::isalnum(c))
            continue;
        if (pending_space)
        {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace processing
