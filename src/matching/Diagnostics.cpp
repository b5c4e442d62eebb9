#include "Diagnostics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace matching
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(std::max<std::size_t>(bytes, 1), std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = std::min(text.size(), MaxPreview());
    // Back off to a code point boundary so the log line stays valid UTF-8
    while (cut > 0 && cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;

    std::string out;
    out.reserve(cut + 24);
    appendEscaped(out, text.substr(0, cut));
    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

std::string Diagnostics::DescribeCandidates(const CandidateList& candidates, std::size_t max_items)
{
    if (candidates.empty())
        return "(none)";

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    const std::size_t shown = std::min(candidates.size(), max_items);
    for (std::size_t i = 0; i < shown; ++i)
        oss << (i ? ", " : "") << candidates[i].commune << '=' << candidates[i].score;
    if (candidates.size() > shown)
        oss << ", +" << candidates.size() - shown << " more";
    return oss.str();
}

void Diagnostics::appendEscaped(std::string& out, std::string_view text)
{
    for (char ch : text)
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(static_cast<unsigned char>(ch) < 0x20 ? '?' : ch);
            break;
        }
    }
}

} // namespace matching
