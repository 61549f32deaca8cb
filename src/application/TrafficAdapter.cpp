/**
 * @file TrafficAdapter.cpp
 * @brief Implementation of TrafficAdapter.
 */

#include "application/TrafficAdapter.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace dualtap::application {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string StripPort(const std::string& host) {
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        return close == std::string::npos ? host : host.substr(1, close - 1);
    }
    auto colon = host.find(':');
    // More than one colon is a bare IPv6 literal, not host:port.
    if (colon != std::string::npos && host.find(':', colon + 1) == std::string::npos) {
        return host.substr(0, colon);
    }
    return host;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TrafficAdapter::TrafficAdapter(std::shared_ptr<domain::EventStore> store,
                               std::shared_ptr<const domain::TitleExtractor> extractor,
                               domain::TrafficCaptureOptions options)
    : m_store(std::move(store)), m_extractor(std::move(extractor)), m_options(std::move(options)) {
    for (auto& target : m_options.targetDomains) {
        target = ToLower(target);
    }
}

bool TrafficAdapter::isTargetHost(const std::string& host) const {
    const std::string normalized = ToLower(StripPort(host));
    if (normalized.empty()) return false;

    return std::any_of(m_options.targetDomains.begin(), m_options.targetDomains.end(),
                       [&normalized](const std::string& target) {
                           return !target.empty() &&
                                  (normalized == target || EndsWith(normalized, "." + target));
                       });
}

void TrafficAdapter::onRequest(domain::HttpFlow& flow) {
    if (!isTargetHost(flow.request.host)) {
        return;
    }

    std::cout << "[TrafficAdapter] Intercepted request: " << flow.request.method << " "
              << flow.request.url << std::endl;

    try {
        m_store->append(domain::NetworkTrafficRecord::FromRequest(flow.request, std::chrono::system_clock::now()));
        ++m_requests;
    } catch (const std::exception& e) {
        ++m_failures;
        std::cerr << "[TrafficAdapter] Failed to record request " << flow.request.url << ": " << e.what() << std::endl;
    }

    // Tags traffic generated through this tool for the downstream server.
    flow.request.headers[m_options.markerHeaderName] = m_options.markerHeaderValue;
}

void TrafficAdapter::onResponse(domain::HttpFlow& flow) {
    if (!flow.response || !isTargetHost(flow.request.host)) {
        return;
    }
    const domain::HttpResponse& response = *flow.response;

    std::cout << "[TrafficAdapter] Intercepted response: " << response.statusCode << " for "
              << flow.request.url << std::endl;

    try {
        m_store->append(domain::NetworkTrafficRecord::FromExchange(flow.request, response,
                                                                   std::chrono::system_clock::now()));
        ++m_responses;
    } catch (const std::exception& e) {
        ++m_failures;
        std::cerr << "[TrafficAdapter] Failed to record response " << flow.request.url << ": " << e.what() << std::endl;
    }

    if (response.body && ToLower(response.contentType()).find("text/html") != std::string::npos) {
        extractArtifact(*response.body, flow.request.url);
    }
}

void TrafficAdapter::extractArtifact(const std::string& html, const std::string& url) {
    if (!m_extractor) return;

    try {
        auto extracted = m_extractor->extract(html);
        if (!extracted) {
            return; // Nothing matched; not an error.
        }

        domain::ScrapedArtifactRecord artifact;
        artifact.timestamp = std::chrono::system_clock::now();
        artifact.title = extracted->title;
        artifact.url = url;
        artifact.extractionMethod = extracted->method;
        m_store->append(artifact);
        ++m_artifacts;
    } catch (const std::exception& e) {
        ++m_failures;
        std::cerr << "[TrafficAdapter] Extraction failed for " << url << ": " << e.what() << std::endl;
    }
}

TrafficAdapter::Stats TrafficAdapter::stats() const {
    Stats s;
    s.requestsCaptured = m_requests.load();
    s.responsesCaptured = m_responses.load();
    s.artifactsExtracted = m_artifacts.load();
    s.failures = m_failures.load();
    return s;
}

} // namespace dualtap::application
