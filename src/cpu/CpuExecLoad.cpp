#include "CpuExecShared.hpp"

namespace gbcore::cpu::exec_detail {

/// @brief LD/LDH in every form: 8-bit moves between any two operand shapes, 16-bit immediate and register
/// loads, LD HL,SP+e8 and LD (a16),SP.
ExecResult execLd(Cpu& cpu, const Instruction& instruction) {
    auto& regs = cpu.registers();
    const Operand& dst = instruction.operand(0);
    const Operand& src = instruction.operand(1);

    if (dst.isWideRegister()) {
        uint16_t value = 0;
        switch (src.kind) {
        case OperandKind::Immediate16:
            value = instruction.imm16();
            break;
        case OperandKind::Register: {
            const auto source = regs.read16(src.reg);
            if (!source.has_value()) {
                return std::unexpected(source.error());
            }
            value = *source;
            break;
        }
        case OperandKind::StackRelative:
            value = addStackOffset(regs, instruction.relative());
            break;
        default:
            return std::unexpected(CpuError::UnsupportedOperand);
        }
        return regs.write16(dst.reg, value).transform([&] { return advance(instruction); });
    }

    if (src.isWideRegister()) {
        if (dst.kind != OperandKind::AbsoluteIndirect) {
            return std::unexpected(CpuError::UnsupportedOperand);
        }
        const uint16_t value = regs.read(src.reg);
        const uint16_t address = instruction.imm16();
        cpu.bus().write(address, static_cast<uint8_t>(value & 0xFFu));
        cpu.bus().write(static_cast<uint16_t>(address + 1), static_cast<uint8_t>(value >> 8));
        return advance(instruction);
    }

    const auto value = readOperand8(cpu, instruction, src);
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }
    return writeOperand8(cpu, instruction, dst, *value).transform([&] { return advance(instruction); });
}

ExecResult execPush(Cpu& cpu, const Instruction& instruction) {
    const auto value = cpu.registers().read16(instruction.operand(0).reg);
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }
    push16(cpu, *value);
    return advance(instruction);
}

/// POP AF goes through the flags register setter, so the low nibble of F comes back as zero.
ExecResult execPop(Cpu& cpu, const Instruction& instruction) {
    const Operand& target = instruction.operand(0);
    if (!target.isWideRegister()) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    const uint16_t value = pop16(cpu);
    return cpu.registers().write16(target.reg, value).transform([&] { return advance(instruction); });
}

}  // namespace gbcore::cpu::exec_detail
