#pragma once

#include <filesystem>
#include <string>

namespace gbcore::common {

/// Simple file logger for diagnostics. Every call is a no-op until init() has opened a log file.
class Logger {
public:
    static void init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

    [[nodiscard]] static bool isOpen();

private:
    Logger() = default;
};

}  // namespace gbcore::common
