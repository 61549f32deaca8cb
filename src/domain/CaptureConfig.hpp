/**
 * @file CaptureConfig.hpp
 * @brief Settings shared by the capture components. Read-only once capture starts.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "domain/TrafficInterceptionEngine.hpp"

namespace dualtap::domain {

/**
 * @struct TrafficCaptureOptions
 * @brief Which hosts are recorded and how forwarded requests are tagged.
 */
struct TrafficCaptureOptions {
    std::vector<std::string> targetDomains{"dawn.com", "www.dawn.com"};
    std::string markerHeaderName = "X-MITM-Agent";
    std::string markerHeaderValue = "MCP-Learn-Agent";
};

/**
 * @struct InstrumentationOptions
 * @brief Attach/spawn directives for the instrumentation engine.
 */
struct InstrumentationOptions {
    std::vector<std::string> fallbackCandidates{"com.android.chrome", "org.mozilla.firefox", "com.opera.browser"};
    std::string spawnTarget = "com.android.chrome";
    std::chrono::milliseconds deviceTimeout{10000};
};

/**
 * @struct CaptureConfig
 * @brief Everything the application needs to wire a capture session.
 */
struct CaptureConfig {
    std::string databasePath;
    ProxyConfig proxy;
    TrafficCaptureOptions traffic;
    InstrumentationOptions instrumentation;
    std::optional<std::string> processName;     ///< Explicit attach target; none means fallback chain.
    std::string hookScriptPath;
    std::chrono::milliseconds startupGrace{2000};
    std::chrono::milliseconds reportInterval{10000};
};

} // namespace dualtap::domain
