/**
 * @file CaptureOrchestrator.hpp
 * @brief Owns the capture lifecycle: traffic engine thread, instrumentation attach, reporting.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include "application/CaptureReport.hpp"
#include "application/InstrumentationAdapter.hpp"
#include "application/StopToken.hpp"
#include "application/TrafficAdapter.hpp"
#include "domain/EventStore.hpp"
#include "domain/TrafficInterceptionEngine.hpp"

namespace dualtap::application {

/**
 * @class CaptureOrchestrator
 * @brief Starts both capture channels and reports what the store has accumulated.
 *
 * Instrumentation is optional. A null adapter (proxy-only mode) or a failed attach
 * leaves traffic capture running.
 */
class CaptureOrchestrator {
public:
    struct Timing {
        std::chrono::milliseconds startupGrace{2000};     ///< Time given to the engine to bind.
        std::chrono::milliseconds reportInterval{10000};
    };

    CaptureOrchestrator(std::shared_ptr<domain::EventStore> store,
                        std::shared_ptr<domain::TrafficInterceptionEngine> engine,
                        std::shared_ptr<TrafficAdapter> trafficAdapter,
                        std::shared_ptr<InstrumentationAdapter> instrumentation,
                        Timing timing,
                        std::ostream& out);
    ~CaptureOrchestrator();

    CaptureOrchestrator(const CaptureOrchestrator&) = delete;
    CaptureOrchestrator& operator=(const CaptureOrchestrator&) = delete;

    /**
     * @brief Launches the engine on its own thread, waits the grace period, then attaches.
     * @return True if instrumentation is active; false means reduced capability
     *         (or a repeated start, which is ignored).
     */
    bool start(const domain::ProxyConfig& proxyConfig,
               const std::optional<std::string>& targetProcessName = std::nullopt);

    /** @brief Reads aggregate counts and recent artifacts. No side effects. */
    CaptureReport report() const;

    /** @brief Writes the rendered report to the output stream. */
    void printReport();

    /**
     * @brief Reports every interval until the token is cancelled, then once more.
     * Blocks the caller.
     */
    void runUntilCancelled(StopToken& token);

    /** @brief Stops the engine, joins its thread and detaches instrumentation. Idempotent. */
    void stop();

    bool isTrafficRunning() const { return m_trafficRunning.load(); }
    bool isInstrumentationActive() const;

private:
    void runTraffic(domain::ProxyConfig proxyConfig);

    std::shared_ptr<domain::EventStore> m_store;
    std::shared_ptr<domain::TrafficInterceptionEngine> m_engine;
    std::shared_ptr<TrafficAdapter> m_trafficAdapter;
    std::shared_ptr<InstrumentationAdapter> m_instrumentation;
    Timing m_timing;
    std::ostream& m_out;

    std::mutex m_lifecycleMutex;
    std::thread m_trafficThread;
    std::atomic<bool> m_trafficRunning{false};
    bool m_started = false;
};

} // namespace dualtap::application
