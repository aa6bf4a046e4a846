#include "gbcore/cpu/Executor.hpp"

#include "CpuExecShared.hpp"

namespace gbcore::cpu {
namespace exec_detail {

bool conditionMet(const Registers& regs, Condition condition) noexcept {
    switch (condition) {
    case Condition::Always:
        return true;
    case Condition::NZ:
        return !regs.testFlag(Flag::Z);
    case Condition::Z:
        return regs.testFlag(Flag::Z);
    case Condition::NC:
        return !regs.testFlag(Flag::C);
    case Condition::C:
        return regs.testFlag(Flag::C);
    }
    return false;
}

std::expected<Location, CpuError> resolveLocation(Cpu& cpu, const Instruction& instruction, const Operand& operand) {
    auto& regs = cpu.registers();
    auto atAddress = [](uint16_t address) { return Location{true, Register::A, address}; };

    switch (operand.kind) {
    case OperandKind::Register:
        if (isWideRegister(operand.reg)) {
            return std::unexpected(CpuError::UnsupportedOperand);
        }
        return Location{false, operand.reg, 0};
    case OperandKind::RegisterIndirect:
        return regs.read16(operand.reg).transform(atAddress);
    case OperandKind::RegisterIndirectDec:
        return regs.readThenDecrement(operand.reg).transform(atAddress);
    case OperandKind::RegisterIndirectInc:
        return regs.readThenIncrement(operand.reg).transform(atAddress);
    case OperandKind::AbsoluteIndirect:
        return atAddress(instruction.imm16());
    case OperandKind::HighImmediateIndirect:
        return atAddress(static_cast<uint16_t>(0xFF00 | instruction.imm8()));
    case OperandKind::HighRegisterIndirect:
        return regs.read8(operand.reg).transform(
            [&](uint8_t low) { return atAddress(static_cast<uint16_t>(0xFF00 | low)); });
    default:
        return std::unexpected(CpuError::UnsupportedOperand);
    }
}

uint8_t load(Cpu& cpu, const Location& location) {
    if (location.memory) {
        return cpu.bus().read(location.address);
    }
    return static_cast<uint8_t>(cpu.registers().read(location.reg));
}

std::expected<void, CpuError> store(Cpu& cpu, const Location& location, uint8_t value) {
    if (location.memory) {
        cpu.bus().write(location.address, value);
        return {};
    }
    return cpu.registers().write8(location.reg, value);
}

std::expected<uint8_t, CpuError> readOperand8(Cpu& cpu, const Instruction& instruction, const Operand& operand) {
    if (operand.kind == OperandKind::Immediate8) {
        return instruction.imm8();
    }
    return resolveLocation(cpu, instruction, operand).transform([&](const Location& location) {
        return load(cpu, location);
    });
}

std::expected<void, CpuError> writeOperand8(Cpu& cpu, const Instruction& instruction, const Operand& operand,
                                            uint8_t value) {
    return resolveLocation(cpu, instruction, operand).and_then([&](const Location& location) {
        return store(cpu, location, value);
    });
}

void push16(Cpu& cpu, uint16_t value) {
    auto& regs = cpu.registers();
    --regs.sp;
    cpu.bus().write(regs.sp, static_cast<uint8_t>(value >> 8));
    --regs.sp;
    cpu.bus().write(regs.sp, static_cast<uint8_t>(value & 0xFFu));
}

uint16_t pop16(Cpu& cpu) {
    auto& regs = cpu.registers();
    const uint8_t low = cpu.bus().read(regs.sp);
    ++regs.sp;
    const uint8_t high = cpu.bus().read(regs.sp);
    ++regs.sp;
    return static_cast<uint16_t>((static_cast<uint16_t>(high) << 8) | low);
}

uint16_t addStackOffset(Registers& regs, int8_t offset) {
    const uint16_t sp = regs.sp;
    const auto unsignedOffset = static_cast<uint8_t>(offset);
    regs.writeFlags({
        {Flag::Z, false},
        {Flag::N, false},
        {Flag::H, ((sp & 0x0F) + (unsignedOffset & 0x0F)) > 0x0F},
        {Flag::C, ((sp & 0xFF) + unsignedOffset) > 0xFF},
    });
    return static_cast<uint16_t>(sp + offset);
}

}  // namespace exec_detail

std::expected<OpResult, CpuError> executeInstruction(Cpu& cpu, const Instruction& instruction) {
    using namespace exec_detail;

    switch (instruction.mnemonic()) {
    case Mnemonic::Ld:
    case Mnemonic::Ldh:
        return execLd(cpu, instruction);
    case Mnemonic::Push:
        return execPush(cpu, instruction);
    case Mnemonic::Pop:
        return execPop(cpu, instruction);

    case Mnemonic::Add:
        return execAdd(cpu, instruction);
    case Mnemonic::Adc:
        return execAdc(cpu, instruction);
    case Mnemonic::Sub:
        return execSub(cpu, instruction);
    case Mnemonic::Sbc:
        return execSbc(cpu, instruction);
    case Mnemonic::And:
        return execAnd(cpu, instruction);
    case Mnemonic::Or:
        return execOr(cpu, instruction);
    case Mnemonic::Xor:
        return execXor(cpu, instruction);
    case Mnemonic::Cp:
        return execCp(cpu, instruction);
    case Mnemonic::Inc:
        return execInc(cpu, instruction);
    case Mnemonic::Dec:
        return execDec(cpu, instruction);
    case Mnemonic::Daa:
        return execDaa(cpu, instruction);
    case Mnemonic::Cpl:
        return execCpl(cpu, instruction);
    case Mnemonic::Scf:
        return execScf(cpu, instruction);
    case Mnemonic::Ccf:
        return execCcf(cpu, instruction);

    case Mnemonic::Rlca:
    case Mnemonic::Rrca:
    case Mnemonic::Rla:
    case Mnemonic::Rra:
        return execRotateAccumulator(cpu, instruction);
    case Mnemonic::Rlc:
    case Mnemonic::Rrc:
    case Mnemonic::Rl:
    case Mnemonic::Rr:
    case Mnemonic::Sla:
    case Mnemonic::Sra:
    case Mnemonic::Srl:
    case Mnemonic::Swap:
        return execShift(cpu, instruction);
    case Mnemonic::Bit:
        return execBit(cpu, instruction);
    case Mnemonic::Set:
    case Mnemonic::Res:
        return execSetRes(cpu, instruction);

    case Mnemonic::Jp:
        return execJp(cpu, instruction);
    case Mnemonic::Jr:
        return execJr(cpu, instruction);
    case Mnemonic::Call:
        return execCall(cpu, instruction);
    case Mnemonic::Ret:
        return execRet(cpu, instruction);
    case Mnemonic::Reti:
        return execReti(cpu, instruction);
    case Mnemonic::Rst:
        return execRst(cpu, instruction);
    case Mnemonic::Ei:
        return execEi(cpu, instruction);
    case Mnemonic::Di:
        return execDi(cpu, instruction);
    case Mnemonic::Halt:
        return execHalt(cpu, instruction);
    case Mnemonic::Stop:
        return execStop(cpu, instruction);
    case Mnemonic::Nop:
        return execNop(cpu, instruction);

    case Mnemonic::Prefix:
        // The decoder folds the prefix into the extended instruction; a bare prefix never reaches here.
        return std::unexpected(CpuError::UnsupportedOperand);
    case Mnemonic::Invalid:
        return execInvalid(cpu, instruction);
    }
    return std::unexpected(CpuError::InvalidOpcode);
}

}  // namespace gbcore::cpu
