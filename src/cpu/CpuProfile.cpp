#include "gbcore/cpu/CpuProfile.hpp"

#include "gbcore/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <exception>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>
using json = nlohmann::json;

namespace gbcore::cpu {
namespace {

std::optional<json> loadJsonFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    json parsed;
    try {
        in >> parsed;
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void mergeJsonObject(json& base, const json& overrides) {
    if (!base.is_object() || !overrides.is_object()) {
        return;
    }

    for (const auto& [key, overrideValue] : overrides.items()) {
        if (overrideValue.is_null()) {
            base.erase(key);
            continue;
        }
        base[key] = overrideValue;
    }
}

std::optional<std::string> readProfileId(const json& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto it = value.find("id");
    if (it == value.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto id = it->get<std::string>();
    if (id.empty()) {
        return std::nullopt;
    }
    return id;
}

/// Overrides replace keys of the bundled entry with the same id; unknown ids are appended.
void applyProfileOverrides(json& baseProfiles, const json& overrideProfiles) {
    std::unordered_map<std::string, size_t> indexById;
    for (size_t i = 0; i < baseProfiles.size(); ++i) {
        if (const auto id = readProfileId(baseProfiles[i]); id.has_value()) {
            indexById[*id] = i;
        }
    }

    for (const auto& overrideEntry : overrideProfiles) {
        const auto id = readProfileId(overrideEntry);
        if (!id.has_value()) {
            continue;
        }

        const auto it = indexById.find(*id);
        if (it == indexById.end()) {
            baseProfiles.push_back(overrideEntry);
            indexById[*id] = baseProfiles.size() - 1;
            continue;
        }

        auto& baseEntry = baseProfiles[it->second];
        if (!baseEntry.is_object()) {
            baseEntry = overrideEntry;
        } else {
            mergeJsonObject(baseEntry, overrideEntry);
        }
    }
}

std::optional<uint64_t> parseHexValue(std::string_view hexStr) {
    if (hexStr.starts_with("0x") || hexStr.starts_with("0X")) {
        hexStr.remove_prefix(2);
    } else if (hexStr.starts_with("$")) {
        hexStr.remove_prefix(1);
    }
    if (hexStr.empty()) {
        return std::nullopt;
    }

    uint64_t value{};
    const char* end = hexStr.data() + hexStr.size();
    auto [ptr, ec] = std::from_chars(hexStr.data(), end, value, 16);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> parseHexJson(const json& value) {
    if (value.is_string()) {
        return parseHexValue(value.get<std::string>());
    }
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    return std::nullopt;
}

/// Missing keys keep the default. Unparseable values and values too wide for the register are rejected.
template <typename T>
bool readRegister(const json& item, const char* key, T& out) {
    const auto it = item.find(key);
    if (it == item.end()) {
        return true;
    }
    const auto value = parseHexJson(*it);
    if (!value.has_value() || *value > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(*value);
    return true;
}

std::optional<CpuProfile> parseProfileEntry(const json& item) {
    CpuProfile profile;
    profile.id = item.value("id", "");
    profile.name = item.value("name", profile.id);
    const bool valid = readRegister(item, "a", profile.a) && readRegister(item, "f", profile.f) &&
                       readRegister(item, "b", profile.b) && readRegister(item, "c", profile.c) &&
                       readRegister(item, "d", profile.d) && readRegister(item, "e", profile.e) &&
                       readRegister(item, "h", profile.h) && readRegister(item, "l", profile.l) &&
                       readRegister(item, "sp", profile.sp) && readRegister(item, "pc", profile.pc);
    if (!valid) {
        return std::nullopt;
    }
    return profile;
}

}  // namespace

std::optional<std::vector<CpuProfile>> loadCpuProfiles() {
    return loadCpuProfiles(common::bundledCpuProfilePath(), common::userCpuOverridePath());
}

std::optional<std::vector<CpuProfile>> loadCpuProfiles(const std::filesystem::path& bundledPath,
                                                       const std::filesystem::path& overridePath) {
    auto mergedProfiles = loadJsonFile(bundledPath);
    if (!mergedProfiles.has_value() || !mergedProfiles->is_array()) {
        return std::nullopt;
    }

    if (!overridePath.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(overridePath, ec) && !ec) {
            auto overrideProfiles = loadJsonFile(overridePath);
            if (!overrideProfiles.has_value() || !overrideProfiles->is_array()) {
                return std::nullopt;
            }
            applyProfileOverrides(*mergedProfiles, *overrideProfiles);
        }
    }

    try {
        std::vector<CpuProfile> profiles;
        profiles.reserve(mergedProfiles->size());
        for (const auto& item : *mergedProfiles) {
            if (!readProfileId(item).has_value()) {
                continue;
            }
            auto profile = parseProfileEntry(item);
            if (!profile.has_value()) {
                return std::nullopt;
            }
            profiles.push_back(std::move(*profile));
        }
        return profiles;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

const CpuProfile* findCpuProfile(const std::vector<CpuProfile>& profiles, std::string_view id) {
    const auto it = std::find_if(profiles.begin(), profiles.end(),
                                 [id](const CpuProfile& profile) { return profile.id == id; });
    if (it == profiles.end()) {
        return nullptr;
    }
    return &(*it);
}

}  // namespace gbcore::cpu
