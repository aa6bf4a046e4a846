#include "CpuExecShared.hpp"

namespace gbcore::cpu::exec_detail {
namespace {

/// ADD A,x and friends name the accumulator explicitly; SUB x, AND x etc. do not.
const Operand& aluSource(const Instruction& instruction) {
    return instruction.operand(1).isNone() ? instruction.operand(0) : instruction.operand(1);
}

uint8_t add8(Registers& regs, uint8_t a, uint8_t value, bool carryIn) {
    const unsigned carry = carryIn ? 1u : 0u;
    const unsigned result = a + value + carry;
    regs.writeFlags({
        {Flag::Z, (result & 0xFFu) == 0},
        {Flag::N, false},
        {Flag::H, ((a & 0x0Fu) + (value & 0x0Fu) + carry) > 0x0Fu},
        {Flag::C, result > 0xFFu},
    });
    return static_cast<uint8_t>(result);
}

uint8_t sub8(Registers& regs, uint8_t a, uint8_t value, bool carryIn) {
    const int carry = carryIn ? 1 : 0;
    const int result = a - value - carry;
    regs.writeFlags({
        {Flag::Z, (result & 0xFF) == 0},
        {Flag::N, true},
        {Flag::H, (a & 0x0F) < (value & 0x0F) + carry},
        {Flag::C, result < 0},
    });
    return static_cast<uint8_t>(result & 0xFF);
}

void logicFlags(Registers& regs, uint8_t result, bool halfCarry) {
    regs.writeFlags({
        {Flag::Z, result == 0},
        {Flag::N, false},
        {Flag::H, halfCarry},
        {Flag::C, false},
    });
}

template <typename Operation>
ExecResult accumulatorOp(Cpu& cpu, const Instruction& instruction, Operation operation) {
    const auto value = readOperand8(cpu, instruction, aluSource(instruction));
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }
    auto& regs = cpu.registers();
    regs.a = operation(regs, regs.a, *value);
    return advance(instruction);
}

ExecResult addHl(Cpu& cpu, const Instruction& instruction) {
    auto& regs = cpu.registers();
    const auto value = regs.read16(instruction.operand(1).reg);
    if (!value.has_value()) {
        return std::unexpected(value.error());
    }
    const uint16_t hl = regs.read(Register::HL);
    const uint32_t result = static_cast<uint32_t>(hl) + *value;
    regs.writeFlags({
        {Flag::N, false},
        {Flag::H, ((hl & 0x0FFFu) + (*value & 0x0FFFu)) > 0x0FFFu},
        {Flag::C, result > 0xFFFFu},
    });
    return regs.write16(Register::HL, static_cast<uint16_t>(result)).transform([&] {
        return advance(instruction);
    });
}

ExecResult step8(Cpu& cpu, const Instruction& instruction, bool increment) {
    const auto location = resolveLocation(cpu, instruction, instruction.operand(0));
    if (!location.has_value()) {
        return std::unexpected(location.error());
    }
    const uint8_t before = load(cpu, *location);
    const auto after = static_cast<uint8_t>(increment ? before + 1 : before - 1);
    // Carry is deliberately left alone.
    cpu.registers().writeFlags({
        {Flag::Z, after == 0},
        {Flag::N, !increment},
        {Flag::H, increment ? (before & 0x0F) == 0x0F : (before & 0x0F) == 0x00},
    });
    return store(cpu, *location, after).transform([&] { return advance(instruction); });
}

ExecResult step16(Cpu& cpu, const Instruction& instruction, bool increment) {
    auto& regs = cpu.registers();
    const Register pair = instruction.operand(0).reg;
    const auto result = increment ? regs.incrementThenRead(pair) : regs.readThenDecrement(pair);
    if (!result.has_value()) {
        return std::unexpected(result.error());
    }
    return advance(instruction);
}

}  // namespace

ExecResult execAdd(Cpu& cpu, const Instruction& instruction) {
    const Operand& target = instruction.operand(0);
    if (target.isWideRegister()) {
        if (target.reg == Register::HL) {
            return addHl(cpu, instruction);
        }
        if (target.reg == Register::SP && instruction.operand(1).kind == OperandKind::SignedImmediate8) {
            auto& regs = cpu.registers();
            regs.sp = addStackOffset(regs, instruction.relative());
            return advance(instruction);
        }
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    return accumulatorOp(cpu, instruction,
                         [](Registers& regs, uint8_t a, uint8_t value) { return add8(regs, a, value, false); });
}

ExecResult execAdc(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction, [](Registers& regs, uint8_t a, uint8_t value) {
        return add8(regs, a, value, regs.testFlag(Flag::C));
    });
}

ExecResult execSub(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction,
                         [](Registers& regs, uint8_t a, uint8_t value) { return sub8(regs, a, value, false); });
}

ExecResult execSbc(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction, [](Registers& regs, uint8_t a, uint8_t value) {
        return sub8(regs, a, value, regs.testFlag(Flag::C));
    });
}

ExecResult execAnd(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction, [](Registers& regs, uint8_t a, uint8_t value) {
        const auto result = static_cast<uint8_t>(a & value);
        logicFlags(regs, result, true);
        return result;
    });
}

ExecResult execOr(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction, [](Registers& regs, uint8_t a, uint8_t value) {
        const auto result = static_cast<uint8_t>(a | value);
        logicFlags(regs, result, false);
        return result;
    });
}

ExecResult execXor(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction, [](Registers& regs, uint8_t a, uint8_t value) {
        const auto result = static_cast<uint8_t>(a ^ value);
        logicFlags(regs, result, false);
        return result;
    });
}

/// CP: subtract for the flags only, A is unchanged.
ExecResult execCp(Cpu& cpu, const Instruction& instruction) {
    return accumulatorOp(cpu, instruction, [](Registers& regs, uint8_t a, uint8_t value) {
        sub8(regs, a, value, false);
        return a;
    });
}

/// INC r / INC (HL) update Z N H; INC rr touches no flags.
ExecResult execInc(Cpu& cpu, const Instruction& instruction) {
    if (instruction.operand(0).isWideRegister()) {
        return step16(cpu, instruction, true);
    }
    return step8(cpu, instruction, true);
}

ExecResult execDec(Cpu& cpu, const Instruction& instruction) {
    if (instruction.operand(0).isWideRegister()) {
        return step16(cpu, instruction, false);
    }
    return step8(cpu, instruction, false);
}

/// @brief Decimal-adjust A after a BCD add or subtract.
///
/// N selects the correction direction. After an addition a nibble is corrected when it overflowed (H/C) or
/// holds a value above 9; after a subtraction only the recorded borrows (H/C) are undone.
ExecResult execDaa(Cpu& cpu, const Instruction& instruction) {
    auto& regs = cpu.registers();
    uint8_t a = regs.a;
    bool carry = regs.testFlag(Flag::C);

    if (!regs.testFlag(Flag::N)) {
        if (carry || a > 0x99) {
            a = static_cast<uint8_t>(a + 0x60);
            carry = true;
        }
        if (regs.testFlag(Flag::H) || (a & 0x0F) > 0x09) {
            a = static_cast<uint8_t>(a + 0x06);
        }
    } else {
        if (carry) {
            a = static_cast<uint8_t>(a - 0x60);
        }
        if (regs.testFlag(Flag::H)) {
            a = static_cast<uint8_t>(a - 0x06);
        }
    }

    regs.a = a;
    regs.writeFlags({
        {Flag::Z, a == 0},
        {Flag::H, false},
        {Flag::C, carry},
    });
    return advance(instruction);
}

ExecResult execCpl(Cpu& cpu, const Instruction& instruction) {
    auto& regs = cpu.registers();
    regs.a = static_cast<uint8_t>(~regs.a);
    regs.writeFlags({{Flag::N, true}, {Flag::H, true}});
    return advance(instruction);
}

ExecResult execScf(Cpu& cpu, const Instruction& instruction) {
    cpu.registers().writeFlags({{Flag::N, false}, {Flag::H, false}, {Flag::C, true}});
    return advance(instruction);
}

ExecResult execCcf(Cpu& cpu, const Instruction& instruction) {
    auto& regs = cpu.registers();
    regs.writeFlags({{Flag::N, false}, {Flag::H, false}, {Flag::C, !regs.testFlag(Flag::C)}});
    return advance(instruction);
}

}  // namespace gbcore::cpu::exec_detail
