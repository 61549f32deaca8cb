#include "infrastructure/PathUtils.hpp"
#include "BuildConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace dualtap::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "DualTap";
constexpr const char* kHookScriptName = "webview_hooks.js";
}

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppDataDir() {
    return GetDataHome() / kAppDirName;
}

fs::path PathUtils::GetDefaultDatabasePath() {
    // The store creates the directory on open.
    return GetAppDataDir() / "capture.db";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

std::vector<fs::path> PathUtils::GetHookScriptCandidates() {
    return {
        fs::path("resources") / "hooks" / kHookScriptName, // Prioritize local checkout
        GetAppDataDir() / "hooks" / kHookScriptName,
        fs::path(build::kInstallDataDir) / "hooks" / kHookScriptName,
    };
}

fs::path PathUtils::GetDefaultHookScriptPath() {
    const std::vector<fs::path> candidates = GetHookScriptCandidates();
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    return candidates.front();
}

} // namespace dualtap::infrastructure
