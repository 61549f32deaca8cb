#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "BuildConfig.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using dualtap::infrastructure::ConfigLoader;
using dualtap::infrastructure::PathUtils;
using json = nlohmann::json;

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;

    const auto testRoot = std::filesystem::temp_directory_path() / "dualtap_config_test";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    // Missing file gives defaults.
    {
        auto config = ConfigLoader::Load((testRoot / "missing.json").string());
        assert(config.proxy.listenPort == 8080);
        assert(config.proxy.listenHost == "127.0.0.1");
        assert(config.traffic.targetDomains.size() == 2);
        assert(config.traffic.markerHeaderName == "X-MITM-Agent");
        assert(config.instrumentation.spawnTarget == "com.android.chrome");
        assert(config.instrumentation.fallbackCandidates.size() == 3);
        assert(!config.processName);
        assert(!config.databasePath.empty());
        assert(config.reportInterval == std::chrono::seconds(10));
    }
    std::cout << "[PASS] Missing settings file yields defaults." << std::endl;

    // Keys present override defaults; absent keys keep them.
    {
        const auto path = testRoot / "settings.json";
        std::ofstream(path) << R"({
            "database_path": "/tmp/dualtap-config-test/capture.db",
            "proxy": { "listen_port": 9090 },
            "target_domains": ["example.com"],
            "marker_header": { "value": "CustomAgent" },
            "instrumentation": {
                "process_name": "com.example.browser",
                "fallback_candidates": ["org.mozilla.firefox"],
                "device_timeout_seconds": 2.5
            },
            "startup_grace_ms": 0,
            "report_interval_seconds": 30
        })";

        auto config = ConfigLoader::Load(path.string());
        assert(config.databasePath == "/tmp/dualtap-config-test/capture.db");
        assert(config.proxy.listenPort == 9090);
        assert(config.proxy.listenHost == "127.0.0.1");
        assert(config.traffic.targetDomains == std::vector<std::string>{"example.com"});
        assert(config.traffic.markerHeaderName == "X-MITM-Agent");
        assert(config.traffic.markerHeaderValue == "CustomAgent");
        assert(config.processName && *config.processName == "com.example.browser");
        assert(config.instrumentation.fallbackCandidates.size() == 1);
        assert(config.instrumentation.spawnTarget == "com.android.chrome");
        assert(config.instrumentation.deviceTimeout == std::chrono::milliseconds(2500));
        assert(config.startupGrace == std::chrono::milliseconds(0));
        assert(config.reportInterval == std::chrono::seconds(30));
    }
    std::cout << "[PASS] Settings override only the keys they name." << std::endl;

    // Wrong types are ignored key by key.
    {
        auto config = ConfigLoader::FromJson(json{
            {"proxy", {{"listen_port", "not a number"}}},
            {"target_domains", 7},
            {"report_interval_seconds", -1},
            {"instrumentation", "not an object"},
        });
        assert(config.proxy.listenPort == 8080);
        assert(config.traffic.targetDomains.size() == 2);
        assert(config.reportInterval == std::chrono::seconds(10));
        assert(config.instrumentation.fallbackCandidates.size() == 3);
    }
    std::cout << "[PASS] Invalid values fall back to defaults." << std::endl;

    // Huge durations are clamped instead of overflowing.
    {
        auto config = ConfigLoader::FromJson(json{
            {"report_interval_seconds", 1e300},
            {"startup_grace_ms", 1e30},
            {"instrumentation", {{"device_timeout_seconds", 9.5e18}}},
        });
        assert(config.reportInterval == ConfigLoader::kMaxDuration);
        assert(config.startupGrace == ConfigLoader::kMaxDuration);
        assert(config.instrumentation.deviceTimeout == ConfigLoader::kMaxDuration);
    }
    std::cout << "[PASS] Oversized durations are clamped." << std::endl;

    // Unparseable file gives defaults.
    {
        const auto path = testRoot / "broken.json";
        std::ofstream(path) << "{ this is not json";
        auto config = ConfigLoader::Load(path.string());
        assert(config.proxy.listenPort == 8080);
    }
    std::cout << "[PASS] Parse errors fall back to defaults." << std::endl;

    // Hook script loading.
    {
        const auto path = testRoot / "hooks.js";
        std::ofstream(path) << "send({type: 'webview_load'});";
        auto script = ConfigLoader::LoadHookScript(path.string());
        assert(script && *script == "send({type: 'webview_load'});");
        assert(!ConfigLoader::LoadHookScript((testRoot / "absent.js").string()));
    }
    std::cout << "[PASS] Hook script is read verbatim." << std::endl;

    // The payload receives the target list as a global ahead of its own code.
    {
        auto composed = ConfigLoader::ComposeHookScript("send(targetDomains);", {"dawn.com", "www.dawn.com"});
        assert(composed == "var targetDomains = [\"dawn.com\",\"www.dawn.com\"];\nsend(targetDomains);");
        assert(ConfigLoader::ComposeHookScript("x();", {}) == "var targetDomains = [];\nx();");
    }
    std::cout << "[PASS] Target domains are bound into the hook payload." << std::endl;

    // Installed payload location is searched after the local and per-user ones.
    {
        auto candidates = PathUtils::GetHookScriptCandidates();
        assert(candidates.size() == 3);
        assert(candidates[0] == std::filesystem::path("resources") / "hooks" / "webview_hooks.js");
        assert(candidates[2] == std::filesystem::path(dualtap::build::kInstallDataDir) / "hooks" / "webview_hooks.js");
    }
    std::cout << "[PASS] Hook payload search covers the install prefix." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
