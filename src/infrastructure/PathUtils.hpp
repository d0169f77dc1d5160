// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace chatstamp::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief Replaces a leading "~" or "~/" with $HOME. */
    static std::string ExpandUser(const std::string& path);
};

} // namespace chatstamp::infrastructure
