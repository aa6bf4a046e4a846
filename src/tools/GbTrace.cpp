#include "gbcore/bus/FlatBus.hpp"
#include "gbcore/common/Log.hpp"
#include "gbcore/common/Logger.hpp"
#include "gbcore/cpu/Cpu.hpp"
#include "gbcore/cpu/CpuProfile.hpp"
#include "gbcore/cpu/Trace.hpp"

#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gbcore::tools {
namespace {

constexpr std::string_view kDefaultProfile = "dmg";

struct ToolOptions {
    std::filesystem::path romPath;
    uint64_t maxSteps = 1000;
    std::optional<std::string> profileId;
    bool trace = false;
    std::optional<std::filesystem::path> logPath;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName << " --rom <file.gb> [--steps <n>] [--profile <id>] [--trace] [--log <file>]\n";
    out << "\nOptions:\n";
    out << "  --rom, -r       ROM image loaded at address $0000\n";
    out << "  --steps, -n     Maximum number of instructions to execute (default: 1000)\n";
    out << "  --profile       Boot register profile id from cpu_profiles.json (default: dmg)\n";
    out << "  --trace, -t     Print every executed instruction\n";
    out << "  --log           Append diagnostics to the given log file\n";
    out << "  --help, -h      Show this help\n";
}

std::expected<ToolOptions, std::string> parseArgs(int argc, char** argv) {
    ToolOptions options;
    bool hasRom = false;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argc > 0 ? argv[0] : "gbcore_trace");
            std::exit(0);
        }
        if (arg == "--rom" || arg == "-r") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.romPath = *value;
            hasRom = true;
            continue;
        }
        if (arg == "--steps" || arg == "-n") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            try {
                options.maxSteps = std::stoull(*value);
            } catch (const std::exception&) {
                return std::unexpected(std::format("Invalid --steps value '{}'", *value));
            }
            continue;
        }
        if (arg == "--profile") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.profileId = *value;
            continue;
        }
        if (arg == "--trace" || arg == "-t") {
            options.trace = true;
            continue;
        }
        if (arg == "--log") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            options.logPath = std::filesystem::path(*value);
            continue;
        }
        return std::unexpected(std::format("Unknown argument '{}'", arg));
    }

    if (!hasRom) {
        return std::unexpected("Missing required --rom argument");
    }
    return options;
}

std::expected<std::vector<uint8_t>, std::string> readBinaryFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (bytes.empty()) {
        return std::unexpected(std::format("'{}' is empty", path.string()));
    }
    return bytes;
}

std::expected<void, std::string> applyBootProfile(cpu::Cpu& core, const ToolOptions& options) {
    const auto profiles = cpu::loadCpuProfiles();
    if (!profiles.has_value()) {
        if (options.profileId.has_value()) {
            return std::unexpected("Failed to load CPU profiles");
        }
        common::logWarning("No CPU profiles available, starting from zeroed registers");
        common::Logger::log("No CPU profiles available, starting from zeroed registers");
        return {};
    }

    const std::string_view id = options.profileId.has_value() ? std::string_view(*options.profileId) : kDefaultProfile;
    const auto* profile = cpu::findCpuProfile(*profiles, id);
    if (profile == nullptr) {
        return std::unexpected(std::format("Unknown CPU profile '{}'", id));
    }
    core.applyProfile(*profile);
    common::logInfo(std::format("Using profile '{}' ({})", profile->id, profile->name));
    return {};
}

std::expected<void, std::string> run(const ToolOptions& options) {
    auto rom = readBinaryFile(options.romPath);
    if (!rom.has_value()) {
        return std::unexpected(rom.error());
    }

    auto memory = std::make_unique<bus::FlatBus>();
    const size_t loaded = memory->load(0, *rom);
    if (loaded < rom->size()) {
        common::logWarning(std::format("ROM truncated to {} bytes", loaded));
    }

    cpu::Cpu core(std::move(memory));
    if (auto applied = applyBootProfile(core, options); !applied.has_value()) {
        return std::unexpected(applied.error());
    }

    uint64_t executed = 0;
    while (executed < options.maxSteps && core.runState() == cpu::RunState::Running) {
        const auto stepped = options.trace ? cpu::traceStep(core, std::cout) : core.step();
        if (!stepped.has_value()) {
            return std::unexpected(std::format("CPU fault at ${:04X} after {} instructions: {}", core.registers().pc,
                                               executed, cpu::cpuErrorToString(stepped.error())));
        }
        ++executed;
    }

    if (core.runState() == cpu::RunState::Halted) {
        common::logInfo("CPU halted");
    } else if (core.runState() == cpu::RunState::Stopped) {
        common::logInfo("CPU stopped");
    }

    std::cout << std::format("PC={:04X} {}\n", core.registers().pc, cpu::formatRegisters(core.registers()));
    std::cout << std::format("Executed {} instructions in {} cycles\n", executed, core.cycles());
    return {};
}

}  // namespace
}  // namespace gbcore::tools

int main(int argc, char** argv) {
    auto options = gbcore::tools::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        gbcore::tools::printUsage(std::cerr, argc > 0 ? argv[0] : "gbcore_trace");
        return 1;
    }

    if (options->logPath.has_value()) {
        gbcore::common::Logger::init(*options->logPath);
    }
    gbcore::common::Logger::log(std::format("Tracing '{}'", options->romPath.string()));

    auto result = gbcore::tools::run(*options);
    if (!result.has_value()) {
        std::cerr << "Error: " << result.error() << '\n';
        gbcore::common::Logger::logError(result.error());
        gbcore::common::Logger::shutdown();
        return 1;
    }

    gbcore::common::Logger::shutdown();
    return 0;
}
