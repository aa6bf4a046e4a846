#include "CpuExecShared.hpp"

namespace gbcore::cpu::exec_detail {

/// JP a16 / JP cc,a16 / JP HL
ExecResult execJp(Cpu& cpu, const Instruction& instruction) {
    const Operand& target = instruction.operand(0);
    if (target.kind == OperandKind::Register) {
        const auto address = cpu.registers().read16(target.reg);
        if (!address.has_value()) {
            return std::unexpected(address.error());
        }
        return jumpTo(instruction, *address);
    }
    if (target.kind != OperandKind::Immediate16) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    if (!conditionMet(cpu.registers(), instruction.def->condition)) {
        return advance(instruction);
    }
    return jumpTo(instruction, instruction.imm16());
}

ExecResult execJr(Cpu& cpu, const Instruction& instruction) {
    if (instruction.operand(0).kind != OperandKind::Relative) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    if (!conditionMet(cpu.registers(), instruction.def->condition)) {
        return advance(instruction);
    }
    return jumpTo(instruction, static_cast<uint16_t>(instruction.nextAddress() + instruction.relative()));
}

ExecResult execCall(Cpu& cpu, const Instruction& instruction) {
    if (instruction.operand(0).kind != OperandKind::Immediate16) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    if (!conditionMet(cpu.registers(), instruction.def->condition)) {
        return advance(instruction);
    }
    push16(cpu, instruction.nextAddress());
    return jumpTo(instruction, instruction.imm16());
}

ExecResult execRet(Cpu& cpu, const Instruction& instruction) {
    if (!conditionMet(cpu.registers(), instruction.def->condition)) {
        return advance(instruction);
    }
    return jumpTo(instruction, pop16(cpu));
}

/// RETI enables interrupts immediately, without the EI delay.
ExecResult execReti(Cpu& cpu, const Instruction& instruction) {
    const uint16_t target = pop16(cpu);
    cpu.setInterruptsEnabled(true);
    return jumpTo(instruction, target);
}

ExecResult execRst(Cpu& cpu, const Instruction& instruction) {
    const Operand& target = instruction.operand(0);
    if (target.kind != OperandKind::Vector) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    push16(cpu, instruction.nextAddress());
    return jumpTo(instruction, target.index);
}

/// EI takes effect once the instruction after it has completed.
ExecResult execEi(Cpu& cpu, const Instruction& instruction) {
    cpu.scheduleInterruptEnable();
    return advance(instruction);
}

ExecResult execDi(Cpu& cpu, const Instruction& instruction) {
    cpu.setInterruptsEnabled(false);
    return advance(instruction);
}

ExecResult execHalt(Cpu& cpu, const Instruction& instruction) {
    cpu.setRunState(RunState::Halted);
    return advance(instruction);
}

ExecResult execStop(Cpu& cpu, const Instruction& instruction) {
    cpu.setRunState(RunState::Stopped);
    return advance(instruction);
}

ExecResult execNop(Cpu&, const Instruction& instruction) {
    return advance(instruction);
}

ExecResult execInvalid(Cpu&, const Instruction&) {
    return std::unexpected(CpuError::InvalidOpcode);
}

}  // namespace gbcore::cpu::exec_detail
