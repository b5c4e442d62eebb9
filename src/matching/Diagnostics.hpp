#pragma once

#include "MatchTypes.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace matching
{

// Switches and formatting for per-query cascade traces. Traces go to the
// matching logger (kLogInstance).
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // User text cut to MaxPreview() bytes on a code point boundary, with
    // \n \r \t escaped and other control bytes shown as '?'
    // "line\nbreak" at 8 bytes -> "line\\nbre... (10 bytes)"
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "Quilpué=0.769, Quillota=0.400" limited to the first max_items entries
    [[nodiscard]] static std::string DescribeCandidates(const CandidateList& candidates, std::size_t max_items = 5);

private:
    static void appendEscaped(std::string& out, std::string_view text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace matching
