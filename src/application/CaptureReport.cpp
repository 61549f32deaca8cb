#include "application/CaptureReport.hpp"
#include "infrastructure/Utf8.hpp"
#include <sstream>

namespace dualtap::application {

std::string TruncateForDisplay(const std::string& text, std::size_t maxChars) {
    if (infrastructure::Utf8::Length(text) <= maxChars) {
        return text;
    }
    return infrastructure::Utf8::Truncate(text, maxChars) + "...";
}

std::string RenderReport(const CaptureReport& report) {
    std::ostringstream out;
    out << "=== STATISTICS ===\n";
    out << "Network requests captured: " << report.trafficCount << "\n";
    out << "Hook events recorded: " << report.hookCount << "\n";
    out << "Artifacts extracted: " << report.artifactCount << "\n";

    if (!report.recentArtifacts.empty()) {
        out << "\nRecent artifacts:\n";
        std::size_t shown = 0;
        for (const auto& artifact : report.recentArtifacts) {
            if (shown++ == CaptureReport::kRecentArtifactLimit) break;
            out << "  - " << TruncateForDisplay(artifact.title, CaptureReport::kTitleDisplayLength) << "\n";
        }
    }
    return out.str();
}

} // namespace dualtap::application
