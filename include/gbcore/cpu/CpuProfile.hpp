#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gbcore::cpu {

/// Register state left behind by a hardware model's boot ROM.
struct CpuProfile {
    std::string id;
    std::string name;
    uint8_t a = 0;
    uint8_t f = 0;
    uint8_t b = 0;
    uint8_t c = 0;
    uint8_t d = 0;
    uint8_t e = 0;
    uint8_t h = 0;
    uint8_t l = 0;
    uint16_t sp = 0xFFFE;
    uint16_t pc = 0x0100;
};

/// @brief Load the bundled profiles merged with the user's override file (if present).
std::optional<std::vector<CpuProfile>> loadCpuProfiles();

/// @brief Load profiles from explicit paths. An empty or missing override path is skipped.
std::optional<std::vector<CpuProfile>> loadCpuProfiles(const std::filesystem::path& bundledPath,
                                                       const std::filesystem::path& overridePath);

const CpuProfile* findCpuProfile(const std::vector<CpuProfile>& profiles, std::string_view id);

}  // namespace gbcore::cpu
