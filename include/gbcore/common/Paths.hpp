#pragma once

#include <filesystem>

namespace gbcore::common {

/// Returns the directory containing the running executable.
std::filesystem::path executableDir();

/// Resolves the full path to the bundled CPU boot profiles.
/// Search order: $APPDIR/usr/share/gbcore/config/cpu_profiles.json ->
/// <exe_dir>/config/cpu_profiles.json
std::filesystem::path bundledCpuProfilePath();

/// Resolves the full path to the optional user profile override file.
/// $XDG_CONFIG_HOME/gbcore/cpu_overrides.json or
/// ~/.config/gbcore/cpu_overrides.json.
/// Returns an empty path when no user config location is available.
std::filesystem::path userCpuOverridePath();

}  // namespace gbcore::common
