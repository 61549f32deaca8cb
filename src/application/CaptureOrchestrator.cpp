/**
 * @file CaptureOrchestrator.cpp
 * @brief Implementation of CaptureOrchestrator.
 */

#include "application/CaptureOrchestrator.hpp"
#include "infrastructure/TimeFormat.hpp"
#include <iostream>

namespace dualtap::application {

CaptureOrchestrator::CaptureOrchestrator(std::shared_ptr<domain::EventStore> store,
                                         std::shared_ptr<domain::TrafficInterceptionEngine> engine,
                                         std::shared_ptr<TrafficAdapter> trafficAdapter,
                                         std::shared_ptr<InstrumentationAdapter> instrumentation,
                                         Timing timing,
                                         std::ostream& out)
    : m_store(std::move(store)),
      m_engine(std::move(engine)),
      m_trafficAdapter(std::move(trafficAdapter)),
      m_instrumentation(std::move(instrumentation)),
      m_timing(timing),
      m_out(out) {}

CaptureOrchestrator::~CaptureOrchestrator() {
    stop();
}

bool CaptureOrchestrator::start(const domain::ProxyConfig& proxyConfig,
                                const std::optional<std::string>& targetProcessName) {
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (m_started) {
            std::cerr << "[CaptureOrchestrator] start() called twice; ignoring." << std::endl;
            return false;
        }
        m_started = true;

        if (m_engine && m_trafficAdapter) {
            m_trafficRunning = true;
            m_trafficThread = std::thread(&CaptureOrchestrator::runTraffic, this, proxyConfig);
        }
    }

    // Give the proxy time to bind before the target starts producing traffic.
    std::this_thread::sleep_for(m_timing.startupGrace);

    if (!m_instrumentation) {
        std::cout << "[CaptureOrchestrator] Instrumentation disabled; capturing traffic only." << std::endl;
        return false;
    }

    if (!m_instrumentation->attach(targetProcessName)) {
        std::cerr << "[CaptureOrchestrator] Instrumentation unavailable (" << m_instrumentation->lastError()
                  << "); continuing with traffic capture only." << std::endl;
        return false;
    }

    std::cout << "[CaptureOrchestrator] Hooks are active and monitoring." << std::endl;
    return true;
}

void CaptureOrchestrator::runTraffic(domain::ProxyConfig proxyConfig) {
    std::cout << "[CaptureOrchestrator] Starting proxy on port " << proxyConfig.listenPort << std::endl;
    try {
        if (!m_engine->run(proxyConfig, *m_trafficAdapter)) {
            std::cerr << "[CaptureOrchestrator] Traffic engine failed to start." << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[CaptureOrchestrator] Traffic engine terminated: " << e.what() << std::endl;
    }
    m_trafficRunning = false;
}

CaptureReport CaptureOrchestrator::report() const {
    CaptureReport report;
    try {
        report.trafficCount = m_store->count(domain::RecordKind::NetworkTraffic);
        report.hookCount = m_store->count(domain::RecordKind::Hook);
        report.artifactCount = m_store->count(domain::RecordKind::ScrapedArtifact);
        report.recentArtifacts = m_store->recentArtifacts(CaptureReport::kRecentArtifactLimit);
    } catch (const domain::StorageFault& e) {
        std::cerr << "[CaptureOrchestrator] Report incomplete: " << e.what() << std::endl;
    }
    return report;
}

void CaptureOrchestrator::printReport() {
    m_out << "\n" << RenderReport(report()) << std::flush;
}

void CaptureOrchestrator::runUntilCancelled(StopToken& token) {
    while (!token.waitFor(m_timing.reportInterval)) {
        m_out << "\n[" << infrastructure::TimeFormat::ToClock(std::chrono::system_clock::now())
              << "] Agent is monitoring..." << std::endl;
        printReport();
    }
    printReport();
}

void CaptureOrchestrator::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_engine) {
        m_engine->shutdown();
    }
    if (m_trafficThread.joinable()) {
        m_trafficThread.join();
    }
    if (m_instrumentation) {
        m_instrumentation->detach();
    }
}

bool CaptureOrchestrator::isInstrumentationActive() const {
    return m_instrumentation && m_instrumentation->state() == AttachState::Active;
}

} // namespace dualtap::application
