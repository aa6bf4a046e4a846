#pragma once

#include "gbcore/bus/Bus.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace gbcore::bus {

/// Plain 64KB RAM with nothing mapped behind it.
class FlatBus final : public Bus {
public:
    static constexpr std::size_t kSize = 0x10000;

    FlatBus() = default;

    /// @brief Build a bus whose memory starts with the given bytes (placed at address 0).
    static FlatBus fromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] uint8_t read(uint16_t address) const override { return memory_[address]; }
    void write(uint16_t address, uint8_t value) override { memory_[address] = value; }

    /// @brief Copy a block into memory. Bytes that would land past 0xFFFF are dropped.
    /// @return Number of bytes actually copied.
    std::size_t load(uint16_t address, std::span<const uint8_t> bytes);

private:
    std::array<uint8_t, kSize> memory_{};
};

}  // namespace gbcore::bus
