#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

/**
 * @brief Accent- and case-insensitive normalizer for Spanish place names.
 *
 * Pipeline: NFKD decomposition, combining-mark removal, Unicode case folding,
 * punctuation/symbol removal, whitespace collapse and trim. Pure and total:
 * invalid UTF-8 degrades to an ASCII-only fold instead of failing.
 *
 * @code
 * FoldingTextNormalizer n;
 * n.normalizeText("  Viña del Mar!! ");  // "vina del mar"
 * n.normalizeText("QUILPUÉ");            // "quilpue"
 * @endcode
 */
class FoldingTextNormalizer : public ITextNormalizer
{
public:
    FoldingTextNormalizer() = default;
    ~FoldingTextNormalizer() override = default;

    FoldingTextNormalizer(const FoldingTextNormalizer&) = delete;
    FoldingTextNormalizer& operator=(const FoldingTextNormalizer&) = delete;

    [[nodiscard]] std::string stripAccents(const std::string& text) const override;
    [[nodiscard]] std::string normalizeText(const std::string& text) const override;
    [[nodiscard]] NormalizedQuery normalize(const std::string& text) const override;

    // Fallback used when utf8proc rejects the input
    [[nodiscard]] static std::string asciiFold(const std::string& text);
};

} // namespace processing
