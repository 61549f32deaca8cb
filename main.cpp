#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "app/DualTapApp.hpp"

using namespace dualtap;

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [command]\n"
              << "\n"
              << "Commands:\n"
              << "  run            Proxy + instrumentation with periodic reports (default)\n"
              << "  proxy-only     Proxy with periodic reports, no instrumentation\n"
              << "  stats          Print statistics for the capture database and exit\n"
              << "  probe URL      Send one GET for an http:// URL through the running proxy\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH  Settings file (default: $XDG_CONFIG_HOME/DualTap/settings.json)\n"
              << "  --db PATH      Capture database, overrides the settings file\n"
              << "  --process NAME Attach to this process instead of the fallback list\n"
              << "  -h, --help     Show this help\n";
}

} // namespace

int main(int argc, char** argv) {
    app::LaunchOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextValue = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            options.configPath = nextValue("--config");
        } else if (arg == "--db") {
            options.databasePath = nextValue("--db");
        } else if (arg == "--process") {
            options.processName = nextValue("--process");
        } else if (arg == "run") {
            options.mode = app::LaunchOptions::Mode::Run;
        } else if (arg == "proxy-only") {
            options.mode = app::LaunchOptions::Mode::ProxyOnly;
        } else if (arg == "stats") {
            options.mode = app::LaunchOptions::Mode::Stats;
        } else if (arg == "probe") {
            options.mode = app::LaunchOptions::Mode::Probe;
            options.probeUrl = nextValue("probe");
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    // Route SIGINT/SIGTERM to the app's sigwait() thread: block them before any thread starts.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    app::DualTapApp application(options);
    return application.Run();
}
