#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

#include "application/CaptureOrchestrator.hpp"
#include "infrastructure/HtmlTitleExtractor.hpp"
#include "infrastructure/SqliteEventStore.hpp"

using namespace dualtap;
using namespace std::chrono_literals;

// Engine that serves until shutdown and lets the test inject flows.
class FakeEngine : public domain::TrafficInterceptionEngine {
public:
    bool run(const domain::ProxyConfig& config, domain::FlowHandler& handler) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_port = config.listenPort;
        m_handler = &handler;
        m_running = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_shutdown; });
        m_running = false;
        m_handler = nullptr;
        return true;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
        m_cv.notify_all();
    }

    bool waitUntilRunning() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, 2s, [this] { return m_running; });
    }

    void deliver(domain::HttpFlow& flow) {
        std::lock_guard<std::mutex> lock(m_mutex);
        assert(m_handler);
        m_handler->onRequest(flow);
        m_handler->onResponse(flow);
    }

    int port() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_port;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    domain::FlowHandler* m_handler = nullptr;
    bool m_running = false;
    bool m_shutdown = false;
    int m_port = 0;
};

class NoDevices : public domain::DeviceProvider {
public:
    std::shared_ptr<domain::Device> findDevice(std::chrono::milliseconds) override { return nullptr; }
};

int main() {
    std::cout << "[Test] Starting Capture Orchestrator Test..." << std::endl;

    const auto testRoot = std::filesystem::temp_directory_path() / "dualtap_orchestrator_test";
    std::filesystem::remove_all(testRoot);
    auto store = std::make_shared<infrastructure::SqliteEventStore>((testRoot / "capture.db").string());

    // Report rendering.
    {
        application::CaptureReport report;
        report.trafficCount = 12;
        report.hookCount = 3;
        report.artifactCount = 2;
        domain::ArtifactSummary longOne;
        longOne.title = std::string(120, 'a');
        domain::ArtifactSummary shortOne;
        shortOne.title = "Short enough headline";
        report.recentArtifacts = {longOne, shortOne};

        std::string text = application::RenderReport(report);
        assert(text.find("=== STATISTICS ===") == 0);
        assert(text.find("Network requests captured: 12\n") != std::string::npos);
        assert(text.find("Hook events recorded: 3\n") != std::string::npos);
        assert(text.find("Artifacts extracted: 2\n") != std::string::npos);
        assert(text.find("  - " + std::string(80, 'a') + "...\n") != std::string::npos);
        assert(text.find("  - Short enough headline\n") != std::string::npos);

        application::CaptureReport empty;
        assert(application::RenderReport(empty).find("Recent artifacts") == std::string::npos);
    }
    std::cout << "[PASS] Report lists counts and truncates long titles." << std::endl;

    auto engine = std::make_shared<FakeEngine>();
    domain::TrafficCaptureOptions trafficOptions;
    auto trafficAdapter = std::make_shared<application::TrafficAdapter>(
        store, std::make_shared<infrastructure::HtmlTitleExtractor>(), trafficOptions);
    auto instrumentation = std::make_shared<application::InstrumentationAdapter>(
        store, std::make_shared<NoDevices>(), "hooks", domain::InstrumentationOptions{});

    application::CaptureOrchestrator::Timing timing;
    timing.startupGrace = 50ms;
    timing.reportInterval = 100ms;
    std::ostringstream out;
    application::CaptureOrchestrator orchestrator(store, engine, trafficAdapter, instrumentation, timing, out);

    // start() returns even though the engine blocks; attach failure only reduces capability.
    domain::ProxyConfig proxy;
    proxy.listenPort = 18080;
    auto begin = std::chrono::steady_clock::now();
    bool hooked = orchestrator.start(proxy);
    auto took = std::chrono::steady_clock::now() - begin;
    assert(!hooked);
    assert(took < 1s);
    assert(engine->waitUntilRunning());
    assert(engine->port() == 18080);
    assert(orchestrator.isTrafficRunning());
    assert(!orchestrator.isInstrumentationActive());
    assert(!orchestrator.start(proxy) && "Second start is ignored.");
    std::cout << "[PASS] Start launches traffic capture and survives instrumentation failure." << std::endl;

    // Traffic keeps flowing to the store.
    {
        domain::HttpFlow flow;
        flow.request.method = "GET";
        flow.request.host = "www.dawn.com";
        flow.request.url = "http://www.dawn.com/latest";
        domain::HttpResponse response;
        response.statusCode = 200;
        response.headers["Content-Type"] = "text/html";
        response.body = "<title>Latest headlines from Dawn</title>";
        flow.response = response;
        engine->deliver(flow);

        auto report = orchestrator.report();
        assert(report.trafficCount == 2);
        assert(report.artifactCount == 1);
        assert(report.hookCount == 0);
        assert(report.recentArtifacts.size() == 1);
        assert(report.recentArtifacts[0].title == "Latest headlines from Dawn");
    }
    std::cout << "[PASS] Report reflects captured traffic." << std::endl;

    // runUntilCancelled prints periodic reports and returns promptly after cancellation.
    {
        application::StopToken token;
        std::thread canceller([&token]() {
            std::this_thread::sleep_for(350ms);
            token.requestStop();
        });
        auto loopStart = std::chrono::steady_clock::now();
        orchestrator.runUntilCancelled(token);
        auto loopTook = std::chrono::steady_clock::now() - loopStart;
        canceller.join();

        assert(loopTook < 2s);
        std::string printed = out.str();
        assert(printed.find("Agent is monitoring...") != std::string::npos);
        assert(printed.find("Network requests captured: 2") != std::string::npos);
        assert(printed.find("  - Latest headlines from Dawn") != std::string::npos);
    }
    std::cout << "[PASS] Monitoring loop stops on cancellation." << std::endl;

    // A token cancelled up front still yields the final report.
    {
        std::ostringstream finalOut;
        application::CaptureOrchestrator reporter(store, nullptr, nullptr, nullptr, timing, finalOut);
        application::StopToken token;
        token.requestStop();
        reporter.runUntilCancelled(token);
        assert(finalOut.str().find("=== STATISTICS ===") != std::string::npos);
        assert(finalOut.str().find("Agent is monitoring...") == std::string::npos);
    }
    std::cout << "[PASS] Cancelled loop prints exactly the final report." << std::endl;

    orchestrator.stop();
    assert(!orchestrator.isTrafficRunning());
    orchestrator.stop();
    std::cout << "[PASS] Stop joins the engine thread and is idempotent." << std::endl;

    store->stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
