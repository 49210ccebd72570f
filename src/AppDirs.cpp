#include "AppDirs.hpp"

#include "Identity.hpp"

#include <cstdlib>
#include <filesystem>

namespace {
std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path HomeDir() {
#ifdef _WIN32
    std::string home = GetEnv("USERPROFILE");
#else
    std::string home = GetEnv("HOME");
#endif
    if (home.empty()) {
        return std::filesystem::temp_directory_path();
    }
    return std::filesystem::path(home);
}
} // namespace

std::string UserDataDir(const std::string& appName) {
    std::filesystem::path base;
#ifdef _WIN32
    const std::string localAppData = GetEnv("LOCALAPPDATA");
    base = localAppData.empty() ? HomeDir() / "AppData" / "Local" : std::filesystem::path(localAppData);
#elif __APPLE__
    base = HomeDir() / "Library" / "Application Support";
#else
    const std::string xdgDataHome = GetEnv("XDG_DATA_HOME");
    if (!xdgDataHome.empty()) {
        base = std::filesystem::absolute(xdgDataHome);
    } else {
        base = HomeDir() / ".local" / "share";
    }
#endif
    return NormalizeAppDir((base / appName).generic_string());
}
