// PathUtils Header
#pragma once
#include <string>
#include <filesystem>
#include <vector>

namespace dualtap::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetAppDataDir();
    static std::filesystem::path GetDefaultDatabasePath();
    static std::filesystem::path GetDefaultConfigPath();
    static std::filesystem::path GetDefaultHookScriptPath();

    // Local checkout, then user data dir, then the install prefix.
    static std::vector<std::filesystem::path> GetHookScriptCandidates();
};

} // namespace dualtap::infrastructure
