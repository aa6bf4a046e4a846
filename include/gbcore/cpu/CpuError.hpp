#pragma once

#include <cstdint>
#include <string_view>

namespace gbcore::cpu {

enum class CpuErrorKind : uint8_t {
    Decode,
    Execution,
};

/// Fatal faults raised while decoding or executing a single instruction.
enum class CpuError : uint8_t {
    UnexpectedEndOfData,  ///< Instruction bytes run past the end of the address space
    InvalidOpcode,        ///< One of the reserved opcodes was executed
    UnsupportedOperand,   ///< Operand shape the executor cannot act on
};

[[nodiscard]] constexpr CpuErrorKind cpuErrorKind(CpuError error) noexcept {
    return error == CpuError::UnexpectedEndOfData ? CpuErrorKind::Decode : CpuErrorKind::Execution;
}

[[nodiscard]] std::string_view cpuErrorToString(CpuError error) noexcept;

}  // namespace gbcore::cpu
