/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace dualtap::infrastructure {

using json = nlohmann::json;

namespace {

// Assigns j[key] to target when present and of the right type; logs otherwise.
template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        target = j[key].get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << e.what() << std::endl;
    }
}

// Values above ConfigLoader::kMaxDuration are clamped to it.
template <typename Rep, typename Period>
void ReadDuration(const json& j, const char* key, std::chrono::duration<Rep, Period>& target,
                  std::chrono::milliseconds unit) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    if (!j[key].is_number() || j[key].get<double>() < 0) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': expected a non-negative number" << std::endl;
        return;
    }
    const double maxMillis = static_cast<double>(ConfigLoader::kMaxDuration.count());
    double requested = j[key].get<double>() * static_cast<double>(unit.count());
    if (requested > maxMillis) {
        std::cerr << "[ConfigLoader] '" << key << "' too large; clamping to "
                  << ConfigLoader::kMaxDuration.count() << " ms" << std::endl;
        requested = maxMillis;
    }
    auto millis = static_cast<long long>(requested);
    target = std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(std::chrono::milliseconds(millis));
}

const json& Section(const json& j, const char* key) {
    static const json empty = json::object();
    if (j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    if (j.contains(key)) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': expected an object" << std::endl;
    }
    return empty;
}

} // namespace

domain::CaptureConfig ConfigLoader::Defaults() {
    domain::CaptureConfig config;
    config.databasePath = PathUtils::GetDefaultDatabasePath().string();
    config.hookScriptPath = PathUtils::GetDefaultHookScriptPath().string();
    return config;
}

domain::CaptureConfig ConfigLoader::FromJson(const json& j) {
    domain::CaptureConfig config = Defaults();
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Settings root is not an object; using defaults." << std::endl;
        return config;
    }

    ReadKey(j, "database_path", config.databasePath);

    const json& proxy = Section(j, "proxy");
    ReadKey(proxy, "listen_host", config.proxy.listenHost);
    ReadKey(proxy, "listen_port", config.proxy.listenPort);

    ReadKey(j, "target_domains", config.traffic.targetDomains);
    const json& marker = Section(j, "marker_header");
    ReadKey(marker, "name", config.traffic.markerHeaderName);
    ReadKey(marker, "value", config.traffic.markerHeaderValue);

    const json& inst = Section(j, "instrumentation");
    std::string processName;
    ReadKey(inst, "process_name", processName);
    if (!processName.empty()) {
        config.processName = processName;
    }
    ReadKey(inst, "fallback_candidates", config.instrumentation.fallbackCandidates);
    ReadKey(inst, "spawn_target", config.instrumentation.spawnTarget);
    ReadDuration(inst, "device_timeout_seconds", config.instrumentation.deviceTimeout, std::chrono::seconds(1));
    ReadKey(inst, "hook_script", config.hookScriptPath);

    ReadDuration(j, "startup_grace_ms", config.startupGrace, std::chrono::milliseconds(1));
    ReadDuration(j, "report_interval_seconds", config.reportInterval, std::chrono::seconds(1));

    return config;
}

domain::CaptureConfig ConfigLoader::Load(const std::string& configPath) {
    std::filesystem::path path(configPath);
    if (!std::filesystem::exists(path)) {
        return Defaults();
    }

    try {
        std::ifstream f(path);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }

    return Defaults();
}

std::optional<std::string> ConfigLoader::LoadHookScript(const std::string& scriptPath) {
    std::ifstream file(scriptPath);
    if (!file.is_open()) {
        std::cerr << "[ConfigLoader] Could not open hook script: " << scriptPath << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string ConfigLoader::ComposeHookScript(const std::string& script,
                                            const std::vector<std::string>& targetDomains) {
    return "var targetDomains = " + json(targetDomains).dump() + ";\n" + script;
}

} // namespace dualtap::infrastructure
