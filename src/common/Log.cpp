#include "gbcore/common/Log.hpp"

#include <iostream>

namespace gbcore::common {

void logInfo(std::string_view message) {
    std::cout << "[info] " << message << '\n';
}

void logWarning(std::string_view message) {
    std::cerr << "[warn] " << message << '\n';
}

}  // namespace gbcore::common
