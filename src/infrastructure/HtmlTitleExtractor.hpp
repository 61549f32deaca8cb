/**
 * @file HtmlTitleExtractor.hpp
 * @brief Tag-pattern heuristic for pulling a title out of captured HTML.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/TitleExtractor.hpp"

namespace dualtap::infrastructure {

/**
 * @class HtmlTitleExtractor
 * @brief Tries an ordered list of element patterns; the first acceptable candidate wins.
 *
 * For each pattern every element is collected in document order. A candidate is
 * stripped of nested markup and surrounding whitespace, then accepted only if it is
 * longer than kMinTitleLength. The first accepted candidate of the first pattern
 * that yields one is returned, truncated to kMaxTitleLength; nothing else is tried.
 * Tag names match case-insensitively and element content may span lines.
 */
class HtmlTitleExtractor : public domain::TitleExtractor {
public:
    static constexpr std::size_t kMinTitleLength = 10;
    static constexpr std::size_t kMaxTitleLength = 500;

    struct TagPattern {
        std::string tag;                ///< Element name, lower case.
        bool allowAttributes = false;   ///< False: only the bare "<tag>" opener matches.
        std::string method;             ///< Extraction method tag recorded on success.
    };

    /** @brief <title>, then <h1 ...>, then <h2 ...>. */
    static std::vector<TagPattern> DefaultPatterns();

    HtmlTitleExtractor();
    explicit HtmlTitleExtractor(std::vector<TagPattern> patterns);

    std::optional<domain::ExtractedTitle> extract(const std::string& html) const override;

private:
    static std::vector<std::string> FindElementContents(const std::string& html,
                                                        const std::string& lowered,
                                                        const TagPattern& pattern);
    static std::string StripMarkup(const std::string& text);

    std::vector<TagPattern> m_patterns;
};

} // namespace dualtap::infrastructure
