#pragma once

#include "gbcore/cpu/CpuError.hpp"

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <string_view>

namespace gbcore::cpu {

enum class Register : uint8_t {
    A,
    F,
    B,
    C,
    D,
    E,
    H,
    L,
    AF,
    BC,
    DE,
    HL,
    SP,
    PC,
};

/// Flag bits as they sit in the F register. The low nibble of F is always zero.
enum class Flag : uint8_t {
    Z = 0x80,
    N = 0x40,
    H = 0x20,
    C = 0x10,
};

struct FlagWrite {
    Flag flag;
    bool value;
};

[[nodiscard]] constexpr bool isWideRegister(Register reg) noexcept {
    return reg >= Register::AF;
}

[[nodiscard]] std::string_view registerName(Register reg) noexcept;

/// SM83 register file.
///
/// The general purpose 8-bit registers and SP/PC are plain fields; F is only reachable through the
/// flag accessors so its low nibble stays zero.
class Registers {
public:
    static constexpr uint8_t kFlagMask = 0xF0;

    uint8_t a = 0;
    uint8_t b = 0;
    uint8_t c = 0;
    uint8_t d = 0;
    uint8_t e = 0;
    uint8_t h = 0;
    uint8_t l = 0;
    uint16_t sp = 0;
    uint16_t pc = 0;

    /// @brief Read any register, 8-bit registers zero-extended.
    [[nodiscard]] uint16_t read(Register reg) const noexcept;

    /// @brief Write any register. Fails if the value does not fit an 8-bit destination.
    std::expected<void, CpuError> write(Register reg, uint16_t value);

    [[nodiscard]] std::expected<uint8_t, CpuError> read8(Register reg) const;
    std::expected<void, CpuError> write8(Register reg, uint8_t value);

    [[nodiscard]] std::expected<uint16_t, CpuError> read16(Register reg) const;
    std::expected<void, CpuError> write16(Register reg, uint16_t value);

    /// @brief Return the pair's value, then decrement the pair (HL- addressing).
    std::expected<uint16_t, CpuError> readThenDecrement(Register pair);

    /// @brief Return the pair's value, then increment the pair (HL+ addressing).
    std::expected<uint16_t, CpuError> readThenIncrement(Register pair);

    /// @brief Increment the pair, then return the new value.
    std::expected<uint16_t, CpuError> incrementThenRead(Register pair);

    [[nodiscard]] bool testFlag(Flag flag) const noexcept { return (f_ & static_cast<uint8_t>(flag)) != 0; }

    /// @brief Set the named flags; flags not listed keep their value.
    void writeFlags(std::initializer_list<FlagWrite> flags) noexcept;

    [[nodiscard]] uint8_t flagsRegister() const noexcept { return f_; }
    void setFlagsRegister(uint8_t value) noexcept { f_ = value & kFlagMask; }

private:
    uint8_t f_ = 0;

    [[nodiscard]] uint8_t* narrow(Register reg) noexcept;
    [[nodiscard]] const uint8_t* narrow(Register reg) const noexcept;
};

}  // namespace gbcore::cpu
