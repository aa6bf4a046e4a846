#pragma once

#include "gbcore/bus/Bus.hpp"
#include "gbcore/cpu/CpuError.hpp"
#include "gbcore/cpu/Instruction.hpp"

#include <cstdint>
#include <expected>
#include <optional>

namespace gbcore::cpu {

/// Forward-only byte cursor over a bus. Stops at the end of the address space instead of wrapping.
class BusReader {
public:
    static constexpr uint32_t kEnd = 0x10000;

    BusReader(const bus::Bus& bus, uint16_t start) : bus_(bus), position_(start) {}

    /// @brief Read the byte under the cursor and advance, or nullopt past 0xFFFF.
    std::optional<uint8_t> next();

    [[nodiscard]] uint32_t position() const noexcept { return position_; }

private:
    const bus::Bus& bus_;
    uint32_t position_;
};

/// @brief Decode the instruction starting at address.
/// Reserved opcodes decode to Mnemonic::Invalid; the only failure is running out of address space.
/// Never writes to the bus.
std::expected<Instruction, CpuError> decodeInstruction(const bus::Bus& bus, uint16_t address);

}  // namespace gbcore::cpu
