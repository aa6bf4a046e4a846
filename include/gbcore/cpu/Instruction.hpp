#pragma once

#include "gbcore/cpu/Registers.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace gbcore::cpu {

enum class Mnemonic : uint8_t {
    Adc,
    Add,
    And,
    Bit,
    Call,
    Ccf,
    Cp,
    Cpl,
    Daa,
    Dec,
    Di,
    Ei,
    Halt,
    Inc,
    Invalid,
    Jp,
    Jr,
    Ld,
    Ldh,
    Nop,
    Or,
    Pop,
    Prefix,
    Push,
    Res,
    Ret,
    Reti,
    Rl,
    Rla,
    Rlc,
    Rlca,
    Rr,
    Rra,
    Rrc,
    Rrca,
    Rst,
    Sbc,
    Scf,
    Set,
    Sla,
    Sra,
    Srl,
    Stop,
    Sub,
    Swap,
    Xor,
};

/// Branch condition tested by JP/JR/CALL/RET.
enum class Condition : uint8_t {
    Always,
    NZ,
    Z,
    NC,
    C,
};

/// Addressing modes. Operands describe where a value lives; they are resolved against the live register
/// file and bus only when the instruction executes.
enum class OperandKind : uint8_t {
    None,
    Register,               ///< r / rr
    Immediate8,             ///< d8
    Immediate16,            ///< d16 / a16 jump target
    RegisterIndirect,       ///< (rr)
    RegisterIndirectDec,    ///< (HL-)
    RegisterIndirectInc,    ///< (HL+)
    AbsoluteIndirect,       ///< (a16)
    HighImmediateIndirect,  ///< ($FF00+a8)
    HighRegisterIndirect,   ///< ($FF00+C)
    Relative,               ///< e8 relative to the next instruction
    SignedImmediate8,       ///< e8 added to SP
    StackRelative,          ///< SP+e8
    BitIndex,               ///< 0-7, stored in Operand::index
    Vector,                 ///< RST target, stored in Operand::index
};

struct Operand {
    OperandKind kind = OperandKind::None;
    Register reg = Register::A;
    uint8_t index = 0;

    [[nodiscard]] constexpr bool isNone() const noexcept { return kind == OperandKind::None; }
    [[nodiscard]] constexpr bool isWideRegister() const noexcept {
        return kind == OperandKind::Register && cpu::isWideRegister(reg);
    }

    constexpr bool operator==(const Operand&) const = default;
};

/// Static per-opcode descriptor.
struct OpcodeDef {
    Mnemonic mnemonic = Mnemonic::Invalid;
    Condition condition = Condition::Always;
    std::array<Operand, 2> operands{};
    uint8_t length = 1;
    uint8_t cycles = 4;       ///< Cost when no branch is taken (or the fixed cost)
    uint8_t cyclesTaken = 0;  ///< Cost when a conditional branch is taken, 0 if not a conditional branch
};

/// A decoded instruction: descriptor plus the raw bytes it was decoded from.
struct Instruction {
    const OpcodeDef* def = nullptr;
    uint16_t address = 0;
    uint8_t length = 0;
    bool extended = false;
    std::array<uint8_t, 3> bytes{};

    [[nodiscard]] Mnemonic mnemonic() const noexcept { return def->mnemonic; }
    [[nodiscard]] const Operand& operand(std::size_t index) const noexcept { return def->operands[index]; }

    /// @brief Opcode byte (the byte after the 0xCB prefix for extended instructions).
    [[nodiscard]] uint8_t opcode() const noexcept { return extended ? bytes[1] : bytes[0]; }

    [[nodiscard]] uint8_t imm8() const noexcept { return bytes[1]; }
    [[nodiscard]] uint16_t imm16() const noexcept {
        return static_cast<uint16_t>(bytes[1] | (static_cast<uint16_t>(bytes[2]) << 8));
    }
    [[nodiscard]] int8_t relative() const noexcept { return static_cast<int8_t>(bytes[1]); }

    /// @brief Address of the instruction that follows this one.
    [[nodiscard]] uint16_t nextAddress() const noexcept { return static_cast<uint16_t>(address + length); }

    bool operator==(const Instruction& other) const {
        return def == other.def && address == other.address && length == other.length &&
               extended == other.extended && bytes == other.bytes;
    }
};

[[nodiscard]] std::string_view mnemonicName(Mnemonic mnemonic) noexcept;
[[nodiscard]] std::string_view conditionName(Condition condition) noexcept;

/// @brief Render an instruction as assembly text, e.g. "LD (HL-),A" or "JR NZ,$0150".
[[nodiscard]] std::string formatInstruction(const Instruction& instruction);

/// @brief Render the raw encoded bytes as space-separated hex.
[[nodiscard]] std::string formatInstructionBytes(const Instruction& instruction);

}  // namespace gbcore::cpu
