/**
 * @file DualTapApp.cpp
 * @brief Implementation of the DualTapApp class.
 */
#include "app/DualTapApp.hpp"

#include <csignal>
#include <iostream>
#include <thread>

#include <httplib.h>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/DeviceProviderFactory.hpp"
#include "infrastructure/HtmlTitleExtractor.hpp"
#include "infrastructure/HttpProxyEngine.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SqliteEventStore.hpp"
#include "infrastructure/UrlParts.hpp"

namespace dualtap::app {

namespace {

constexpr const char* kProbeUserAgent = "MCP-Learn-Agent/1.0";
constexpr std::size_t kRecentTrafficLimit = 5;

std::string ResolveConfigPath(const std::string& requested) {
    return requested.empty() ? infrastructure::PathUtils::GetDefaultConfigPath().string() : requested;
}

// Blocks until SIGINT or SIGTERM arrives, then cancels the token.
std::thread StartSignalWatcher(application::StopToken& token) {
    return std::thread([&token]() {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            std::cout << "\n[DualTapApp] Signal " << received << " received, stopping..." << std::endl;
        }
        token.requestStop();
    });
}

} // namespace

DualTapApp::DualTapApp(LaunchOptions options) : m_options(std::move(options)) {}

int DualTapApp::Run() {
    if (m_options.mode == LaunchOptions::Mode::Probe) {
        m_config = infrastructure::ConfigLoader::Load(ResolveConfigPath(m_options.configPath));
        return RunProbe();
    }

    if (!Init()) {
        return 1;
    }

    int exitCode = 0;
    switch (m_options.mode) {
        case LaunchOptions::Mode::Stats:
            exitCode = RunStats();
            break;
        case LaunchOptions::Mode::ProxyOnly:
            exitCode = RunCapture(false);
            break;
        case LaunchOptions::Mode::Run:
        default:
            exitCode = RunCapture(true);
            break;
    }

    Shutdown();
    return exitCode;
}

bool DualTapApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(ResolveConfigPath(m_options.configPath));

    if (m_options.databasePath) {
        m_config.databasePath = *m_options.databasePath;
    }
    if (m_options.processName) {
        m_config.processName = m_options.processName;
    }

    try {
        m_services.eventStore = std::make_shared<infrastructure::SqliteEventStore>(m_config.databasePath);
    } catch (const domain::StorageFault& e) {
        std::cerr << "[DualTapApp] Cannot open event store: " << e.what() << std::endl;
        return false;
    }
    std::cout << "[DualTapApp] Event store: " << m_config.databasePath << std::endl;
    return true;
}

int DualTapApp::RunCapture(bool withInstrumentation) {
    std::cout << "Starting capture" << (withInstrumentation ? " (proxy + instrumentation)" : " (proxy only)") << std::endl;
    std::cout << "Target domains:";
    for (const auto& target : m_config.traffic.targetDomains) {
        std::cout << " " << target;
    }
    std::cout << std::endl;

    m_services.trafficEngine = std::make_shared<infrastructure::HttpProxyEngine>();
    m_services.trafficAdapter = std::make_shared<application::TrafficAdapter>(
        m_services.eventStore,
        std::make_shared<infrastructure::HtmlTitleExtractor>(),
        m_config.traffic);

    if (withInstrumentation) {
        // An unreadable payload leaves the script empty; attach then fails at the Scripted stage.
        std::string hookScript;
        if (auto loaded = infrastructure::ConfigLoader::LoadHookScript(m_config.hookScriptPath)) {
            hookScript = infrastructure::ConfigLoader::ComposeHookScript(*loaded, m_config.traffic.targetDomains);
        }
        m_services.instrumentationAdapter = std::make_shared<application::InstrumentationAdapter>(
            m_services.eventStore,
            infrastructure::CreateDeviceProvider(),
            std::move(hookScript),
            m_config.instrumentation);
    }

    application::CaptureOrchestrator::Timing timing;
    timing.startupGrace = m_config.startupGrace;
    timing.reportInterval = m_config.reportInterval;
    m_services.orchestrator = std::make_unique<application::CaptureOrchestrator>(
        m_services.eventStore,
        m_services.trafficEngine,
        m_services.trafficAdapter,
        m_services.instrumentationAdapter,
        timing,
        std::cout);

    std::thread signalWatcher = StartSignalWatcher(m_stopToken);

    m_services.orchestrator->start(m_config.proxy, m_config.processName);

    std::cout << "\nCapture is running. Point the target's HTTP proxy at "
              << m_config.proxy.listenHost << ":" << m_config.proxy.listenPort
              << " and press Ctrl+C to stop." << std::endl;

    m_services.orchestrator->runUntilCancelled(m_stopToken);
    signalWatcher.join();

    std::cout << "\nCapture finished. Data stored in " << m_config.databasePath << std::endl;
    return 0;
}

int DualTapApp::RunStats() {
    application::CaptureOrchestrator reporter(m_services.eventStore, nullptr, nullptr, nullptr, {}, std::cout);
    reporter.printReport();

    try {
        auto recent = m_services.eventStore->recentTraffic(kRecentTrafficLimit);
        if (!recent.empty()) {
            std::cout << "\nRecent traffic:" << std::endl;
            for (const auto& row : recent) {
                std::cout << "  " << row.timestamp << " " << row.method << " " << row.url;
                if (row.statusCode) {
                    std::cout << " -> " << *row.statusCode;
                }
                std::cout << std::endl;
            }
        }
    } catch (const domain::StorageFault& e) {
        std::cerr << "[DualTapApp] Cannot list traffic: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int DualTapApp::RunProbe() {
    auto target = infrastructure::UrlParts::ParseAbsolute(m_options.probeUrl);
    if (!target || target->scheme != "http") {
        std::cerr << "[DualTapApp] Probe needs an absolute http:// URL: " << m_options.probeUrl << std::endl;
        return 2;
    }

    std::cout << "[Probe] GET " << target->url() << " via proxy "
              << m_config.proxy.listenHost << ":" << m_config.proxy.listenPort << std::endl;

    httplib::Client client(target->host, target->port);
    client.set_proxy(m_config.proxy.listenHost, m_config.proxy.listenPort);
    client.set_connection_timeout(10, 0);
    client.set_read_timeout(10, 0);

    auto res = client.Get(target->path, httplib::Headers{{"User-Agent", kProbeUserAgent}});
    if (!res) {
        std::cerr << "[Probe] Request failed: " << static_cast<int>(res.error()) << std::endl;
        return 1;
    }

    std::cout << "[Probe] Response code: " << res->status << std::endl;
    std::cout << "[Probe] Response size: " << res->body.size() << " bytes" << std::endl;
    return res->status < 400 ? 0 : 1;
}

void DualTapApp::Shutdown() {
    if (m_services.orchestrator) {
        m_services.orchestrator->stop();
    }
    m_services.orchestrator.reset();
    m_services.instrumentationAdapter.reset();
    m_services.trafficAdapter.reset();
    m_services.trafficEngine.reset();
    m_services.eventStore.reset();
}

} // namespace dualtap::app
