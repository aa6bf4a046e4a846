#pragma once

#include "gbcore/cpu/Instruction.hpp"

#include <cstdint>

namespace gbcore::cpu {

/// Prefix byte that selects the extended (bit/rotate/shift) opcode table.
inline constexpr uint8_t kExtendedPrefix = 0xCB;

[[nodiscard]] const OpcodeDef& primaryOpcode(uint8_t opcode) noexcept;
[[nodiscard]] const OpcodeDef& extendedOpcode(uint8_t opcode) noexcept;

}  // namespace gbcore::cpu
