#pragma once

#include <string_view>

namespace gbcore::common {

/// Console progress output for command-line tools.
void logInfo(std::string_view message);

/// Non-fatal problems, written to stderr so they stay out of trace output.
void logWarning(std::string_view message);

}  // namespace gbcore::common
