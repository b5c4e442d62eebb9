#pragma once

#include <string>

namespace processing
{

struct NormalizedQuery
{
    std::string original;
    std::string normalized;

    bool empty() const { return normalized.empty(); }

    bool operator==(const NormalizedQuery&) const = default;
};

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Removes combining marks after canonical decomposition, keeping case ("Ñuñoa" -> "Nunoa")
    [[nodiscard]] virtual std::string stripAccents(const std::string& text) const = 0;

    // Full folding pipeline: accents, case, punctuation, whitespace
    [[nodiscard]] virtual std::string normalizeText(const std::string& text) const = 0;

    [[nodiscard]] virtual NormalizedQuery normalize(const std::string& text) const = 0;
};

} // namespace processing
