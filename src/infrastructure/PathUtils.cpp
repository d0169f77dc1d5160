#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace chatstamp::infrastructure {

namespace fs = std::filesystem;

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

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "chatstamp" / "settings.json";
}

std::string PathUtils::ExpandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path; // ~otheruser is left alone

    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

} // namespace chatstamp::infrastructure
