#include "CpuExecShared.hpp"

#include <utility>

namespace gbcore::cpu::exec_detail {
namespace {

/// One-bit rotate/shift. Returns the new value and the bit shifted out.
std::pair<uint8_t, bool> shiftByOne(Mnemonic mnemonic, uint8_t value, bool carryIn) {
    const bool top = (value & 0x80) != 0;
    const bool bottom = (value & 0x01) != 0;

    switch (mnemonic) {
    case Mnemonic::Rlc:
        return {static_cast<uint8_t>((value << 1) | (top ? 0x01 : 0x00)), top};
    case Mnemonic::Rrc:
        return {static_cast<uint8_t>((value >> 1) | (bottom ? 0x80 : 0x00)), bottom};
    case Mnemonic::Rl:
        return {static_cast<uint8_t>((value << 1) | (carryIn ? 0x01 : 0x00)), top};
    case Mnemonic::Rr:
        return {static_cast<uint8_t>((value >> 1) | (carryIn ? 0x80 : 0x00)), bottom};
    case Mnemonic::Sla:
        return {static_cast<uint8_t>(value << 1), top};
    case Mnemonic::Sra:
        return {static_cast<uint8_t>((value >> 1) | (value & 0x80)), bottom};
    case Mnemonic::Srl:
        return {static_cast<uint8_t>(value >> 1), bottom};
    case Mnemonic::Swap:
        return {static_cast<uint8_t>((value << 4) | (value >> 4)), false};
    default:
        return {value, carryIn};
    }
}

Mnemonic extendedForm(Mnemonic accumulatorForm) {
    switch (accumulatorForm) {
    case Mnemonic::Rlca:
        return Mnemonic::Rlc;
    case Mnemonic::Rrca:
        return Mnemonic::Rrc;
    case Mnemonic::Rla:
        return Mnemonic::Rl;
    default:
        return Mnemonic::Rr;
    }
}

std::expected<uint8_t, CpuError> bitOperandIndex(const Instruction& instruction) {
    const Operand& bit = instruction.operand(0);
    if (bit.kind != OperandKind::BitIndex || bit.index > 7) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    return bit.index;
}

}  // namespace

/// RLCA RRCA RLA RRA: same bit movement as the CB forms, but Z is always cleared.
ExecResult execRotateAccumulator(Cpu& cpu, const Instruction& instruction) {
    auto& regs = cpu.registers();
    const auto [result, carryOut] = shiftByOne(extendedForm(instruction.mnemonic()), regs.a, regs.testFlag(Flag::C));
    regs.a = result;
    regs.writeFlags({
        {Flag::Z, false},
        {Flag::N, false},
        {Flag::H, false},
        {Flag::C, carryOut},
    });
    return advance(instruction);
}

/// CB-prefixed RLC RRC RL RR SLA SRA SRL SWAP on a register or (HL).
ExecResult execShift(Cpu& cpu, const Instruction& instruction) {
    const auto location = resolveLocation(cpu, instruction, instruction.operand(0));
    if (!location.has_value()) {
        return std::unexpected(location.error());
    }

    auto& regs = cpu.registers();
    const auto [result, carryOut] =
        shiftByOne(instruction.mnemonic(), load(cpu, *location), regs.testFlag(Flag::C));
    regs.writeFlags({
        {Flag::Z, result == 0},
        {Flag::N, false},
        {Flag::H, false},
        {Flag::C, carryOut},
    });
    return store(cpu, *location, result).transform([&] { return advance(instruction); });
}

ExecResult execBit(Cpu& cpu, const Instruction& instruction) {
    const auto bit = bitOperandIndex(instruction);
    if (!bit.has_value()) {
        return std::unexpected(bit.error());
    }
    const auto value = readOperand8(cpu, instruction, instruction.operand(1));
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }
    cpu.registers().writeFlags({
        {Flag::Z, ((*value >> *bit) & 0x01) == 0},
        {Flag::N, false},
        {Flag::H, true},
    });
    return advance(instruction);
}

/// SET b / RES b. No flags.
ExecResult execSetRes(Cpu& cpu, const Instruction& instruction) {
    const auto bit = bitOperandIndex(instruction);
    if (!bit.has_value()) {
        return std::unexpected(bit.error());
    }
    const auto location = resolveLocation(cpu, instruction, instruction.operand(1));
    if (!location.has_value()) {
        return std::unexpected(location.error());
    }

    const auto mask = static_cast<uint8_t>(1u << *bit);
    const uint8_t value = load(cpu, *location);
    const auto result = instruction.mnemonic() == Mnemonic::Set ? static_cast<uint8_t>(value | mask)
                                                                 : static_cast<uint8_t>(value & ~mask);
    return store(cpu, *location, result).transform([&] { return advance(instruction); });
}

}  // namespace gbcore::cpu::exec_detail
