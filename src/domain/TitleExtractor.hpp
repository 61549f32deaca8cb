/**
 * @file TitleExtractor.hpp
 * @brief Strategy interface for pulling a title out of an HTML document.
 */

#pragma once
#include <optional>
#include <string>

namespace dualtap::domain {

/**
 * @struct ExtractedTitle
 * @brief Result of a successful extraction pass.
 */
struct ExtractedTitle {
    std::string title;
    std::string method; ///< Tag naming the heuristic that matched.
};

/**
 * @class TitleExtractor
 * @brief Best-effort, replaceable heuristic. std::nullopt means nothing matched.
 *
 * Implementations must be deterministic: the same input always yields the same output.
 */
class TitleExtractor {
public:
    virtual ~TitleExtractor() = default;

    virtual std::optional<ExtractedTitle> extract(const std::string& html) const = 0;
};

} // namespace dualtap::domain
