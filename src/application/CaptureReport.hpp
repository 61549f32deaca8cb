/**
 * @file CaptureReport.hpp
 * @brief Aggregate snapshot of the Event Store and its console rendering.
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/EventStore.hpp"

namespace dualtap::application {

struct CaptureReport {
    static constexpr std::size_t kRecentArtifactLimit = 3;
    static constexpr std::size_t kTitleDisplayLength = 80;

    std::int64_t trafficCount = 0;
    std::int64_t hookCount = 0;
    std::int64_t artifactCount = 0;
    std::vector<domain::ArtifactSummary> recentArtifacts; ///< Newest first.
};

/** @brief Counts per table, then up to three recent artifact titles. */
std::string RenderReport(const CaptureReport& report);

/** @brief First maxChars characters of text, with "..." appended if anything was cut. */
std::string TruncateForDisplay(const std::string& text, std::size_t maxChars);

} // namespace dualtap::application
