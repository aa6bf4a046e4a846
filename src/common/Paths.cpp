#include "gbcore/common/Paths.hpp"

#include <unistd.h>

#include <climits>
#include <cstdlib>

namespace gbcore::common {
namespace {

std::filesystem::path getExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

bool fileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

/// Read-only data directory (bundled config).
///
/// Search order:
/// 1. $APPDIR/usr/share/gbcore/  (AppImage on Linux)
/// 2. <exe_dir>/
std::filesystem::path bundledDataDir() {
    if (const char* appDir = std::getenv("APPDIR"); appDir != nullptr) {
        auto candidate = std::filesystem::path(appDir) / "usr" / "share" / "gbcore";
        std::error_code ec;
        if (std::filesystem::is_directory(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return executableDir();
}

/// Uses $XDG_CONFIG_HOME/gbcore/ or falls back to ~/.config/gbcore/.
std::filesystem::path userConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "gbcore";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "gbcore";
    }
    return {};
}

}  // namespace

std::filesystem::path executableDir() {
    static const std::filesystem::path dir = getExecutablePath().parent_path();
    return dir;
}

std::filesystem::path bundledCpuProfilePath() {
    constexpr const char* kConfigFilename = "cpu_profiles.json";

    const auto dataDir = bundledDataDir();
    auto bundledConfig = dataDir / "config" / kConfigFilename;

    if (!fileExists(bundledConfig)) {
        auto exeRelative = executableDir() / "config" / kConfigFilename;
        if (fileExists(exeRelative)) {
            bundledConfig = exeRelative;
        }
    }

    return bundledConfig;
}

std::filesystem::path userCpuOverridePath() {
    const auto userDir = userConfigDir();
    if (userDir.empty()) {
        return {};
    }
    return userDir / "cpu_overrides.json";
}

}  // namespace gbcore::common
