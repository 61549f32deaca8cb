/**
 * @file ScrapedArtifactRecord.hpp
 * @brief Domain entity for content extracted from a captured response body.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace dualtap::domain {

/**
 * @class ScrapedArtifactRecord
 * @brief Immutable row of the scraped_articles table.
 */
class ScrapedArtifactRecord {
public:
    static constexpr std::size_t kMaxTitleLength = 500; ///< In UTF-8 code points.

    std::chrono::system_clock::time_point timestamp;
    std::string title;
    std::string url;
    std::optional<std::string> content;
    std::optional<std::string> metadata;
    std::string extractionMethod;   ///< Names the heuristic that produced the title.

    ScrapedArtifactRecord() = default;
};

} // namespace dualtap::domain
