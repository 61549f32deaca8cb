/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading capture configuration (settings.json) and the hook payload.
 *
 * Every key is optional. Missing files, parse errors and wrong-typed keys are
 * reported on stderr and fall back to defaults, so a bad settings file never
 * prevents capture from starting.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/CaptureConfig.hpp"

namespace dualtap::infrastructure {

class ConfigLoader {
public:
    /** @brief Upper bound for every duration setting. */
    static constexpr std::chrono::milliseconds kMaxDuration{std::chrono::hours(24)};

    /**
     * @brief Built-in defaults, with XDG-based database and hook script locations.
     */
    static domain::CaptureConfig Defaults();

    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json. A missing file yields Defaults().
     */
    static domain::CaptureConfig Load(const std::string& configPath);

    /**
     * @brief Overlays the keys present in a parsed document onto Defaults().
     */
    static domain::CaptureConfig FromJson(const nlohmann::json& j);

    /**
     * @brief Reads the hook payload handed to the instrumentation engine.
     * @return File contents, or nullopt if the file cannot be read.
     */
    static std::optional<std::string> LoadHookScript(const std::string& scriptPath);

    /**
     * @brief Prepends the target domain list as the global `targetDomains`, which the
     * hook payload uses to filter what it reports.
     */
    static std::string ComposeHookScript(const std::string& script,
                                         const std::vector<std::string>& targetDomains);
};

} // namespace dualtap::infrastructure
