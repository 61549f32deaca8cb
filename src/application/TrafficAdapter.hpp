/**
 * @file TrafficAdapter.hpp
 * @brief Records proxy-observed flows for the configured target hosts.
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "domain/CaptureConfig.hpp"
#include "domain/EventStore.hpp"
#include "domain/TitleExtractor.hpp"
#include "domain/TrafficInterceptionEngine.hpp"

namespace dualtap::application {

/**
 * @class TrafficAdapter
 * @brief FlowHandler that filters by host, normalizes flows into NetworkTrafficRecords
 * and extracts artifacts from HTML responses.
 *
 * Called concurrently from the engine's worker threads. No callback ever throws:
 * storage and extraction failures are logged and counted, and the engine carries on.
 */
class TrafficAdapter : public domain::FlowHandler {
public:
    struct Stats {
        std::uint64_t requestsCaptured = 0;
        std::uint64_t responsesCaptured = 0;
        std::uint64_t artifactsExtracted = 0;
        std::uint64_t failures = 0;
    };

    TrafficAdapter(std::shared_ptr<domain::EventStore> store,
                   std::shared_ptr<const domain::TitleExtractor> extractor,
                   domain::TrafficCaptureOptions options);

    /** @brief Writes a request-only record and tags the outgoing request for target hosts. */
    void onRequest(domain::HttpFlow& flow) override;

    /** @brief Writes the full exchange record and scrapes HTML bodies for target hosts. */
    void onResponse(domain::HttpFlow& flow) override;

    /**
     * @brief Exact or subdomain match against the target list.
     * @param host Host as seen by the proxy; case and any ":port" suffix are ignored.
     */
    bool isTargetHost(const std::string& host) const;

    Stats stats() const;

private:
    void extractArtifact(const std::string& html, const std::string& url);

    std::shared_ptr<domain::EventStore> m_store;
    std::shared_ptr<const domain::TitleExtractor> m_extractor;
    domain::TrafficCaptureOptions m_options;

    std::atomic<std::uint64_t> m_requests{0};
    std::atomic<std::uint64_t> m_responses{0};
    std::atomic<std::uint64_t> m_artifacts{0};
    std::atomic<std::uint64_t> m_failures{0};
};

} // namespace dualtap::application
