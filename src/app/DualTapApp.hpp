/**
 * @file DualTapApp.hpp
 * @brief Command-line application wiring the capture services together.
 */

#pragma once

#include <optional>
#include <string>
#include "application/CaptureServices.hpp"
#include "application/StopToken.hpp"
#include "domain/CaptureConfig.hpp"

namespace dualtap::app {

/**
 * @struct LaunchOptions
 * @brief Parsed command line.
 */
struct LaunchOptions {
    enum class Mode {
        Run,        ///< Proxy + instrumentation + periodic reports.
        Stats,      ///< One report from the existing database.
        ProxyOnly,  ///< Proxy + periodic reports, no instrumentation.
        Probe       ///< One request through a running proxy.
    };

    Mode mode = Mode::Run;
    std::string configPath;
    std::optional<std::string> processName;
    std::optional<std::string> databasePath;
    std::string probeUrl;
};

/**
 * @class DualTapApp
 * @brief Orchestrates the application lifecycle: initialization, the selected mode, shutdown.
 *
 * SIGINT and SIGTERM must be blocked in every thread before Run() is called; a
 * dedicated thread receives them with sigwait() and cancels the reporting loop.
 */
class DualTapApp {
public:
    explicit DualTapApp(LaunchOptions options);

    /**
     * @brief Runs the selected mode.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /** @brief Loads configuration and opens the event store. */
    bool Init();

    /** @brief Stops the capture services and closes the store. */
    void Shutdown();

    int RunCapture(bool withInstrumentation);
    int RunStats();
    int RunProbe();

    LaunchOptions m_options;
    domain::CaptureConfig m_config;
    application::CaptureServices m_services;
    application::StopToken m_stopToken;
};

} // namespace dualtap::app
