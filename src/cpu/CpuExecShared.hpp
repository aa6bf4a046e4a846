#pragma once

#include "gbcore/cpu/Cpu.hpp"
#include "gbcore/cpu/CpuError.hpp"
#include "gbcore/cpu/Instruction.hpp"

#include <cstdint>
#include <expected>

namespace gbcore::cpu::exec_detail {

using ExecResult = std::expected<OpResult, CpuError>;

/// Where an 8-bit operand lives once its addressing mode has been resolved.
struct Location {
    bool memory = false;
    Register reg = Register::A;
    uint16_t address = 0;
};

/// @brief Fall through to the next instruction with the base cycle cost.
[[nodiscard]] inline OpResult advance(const Instruction& instruction) {
    return {instruction.nextAddress(), instruction.def->cycles};
}

/// @brief Transfer control with the taken cost (or the fixed cost for unconditional forms).
[[nodiscard]] inline OpResult jumpTo(const Instruction& instruction, uint16_t target) {
    const uint8_t cycles =
        instruction.def->condition == Condition::Always ? instruction.def->cycles : instruction.def->cyclesTaken;
    return {target, cycles};
}

[[nodiscard]] bool conditionMet(const Registers& regs, Condition condition) noexcept;

/// @brief Resolve an 8-bit register or memory operand. Auto inc/dec side effects happen here, once.
std::expected<Location, CpuError> resolveLocation(Cpu& cpu, const Instruction& instruction, const Operand& operand);
uint8_t load(Cpu& cpu, const Location& location);
std::expected<void, CpuError> store(Cpu& cpu, const Location& location, uint8_t value);

/// @brief Read an 8-bit operand: immediates or any resolvable location.
std::expected<uint8_t, CpuError> readOperand8(Cpu& cpu, const Instruction& instruction, const Operand& operand);
std::expected<void, CpuError> writeOperand8(Cpu& cpu, const Instruction& instruction, const Operand& operand,
                                            uint8_t value);

void push16(Cpu& cpu, uint16_t value);
uint16_t pop16(Cpu& cpu);

/// @brief SP + signed 8-bit offset with the flags shared by ADD SP,e8 and LD HL,SP+e8.
uint16_t addStackOffset(Registers& regs, int8_t offset);

// Loads (CpuExecLoad.cpp)
ExecResult execLd(Cpu& cpu, const Instruction& instruction);
ExecResult execPush(Cpu& cpu, const Instruction& instruction);
ExecResult execPop(Cpu& cpu, const Instruction& instruction);

// Arithmetic and logic (CpuExecAlu.cpp)
ExecResult execAdd(Cpu& cpu, const Instruction& instruction);
ExecResult execAdc(Cpu& cpu, const Instruction& instruction);
ExecResult execSub(Cpu& cpu, const Instruction& instruction);
ExecResult execSbc(Cpu& cpu, const Instruction& instruction);
ExecResult execAnd(Cpu& cpu, const Instruction& instruction);
ExecResult execOr(Cpu& cpu, const Instruction& instruction);
ExecResult execXor(Cpu& cpu, const Instruction& instruction);
ExecResult execCp(Cpu& cpu, const Instruction& instruction);
ExecResult execInc(Cpu& cpu, const Instruction& instruction);
ExecResult execDec(Cpu& cpu, const Instruction& instruction);
ExecResult execDaa(Cpu& cpu, const Instruction& instruction);
ExecResult execCpl(Cpu& cpu, const Instruction& instruction);
ExecResult execScf(Cpu& cpu, const Instruction& instruction);
ExecResult execCcf(Cpu& cpu, const Instruction& instruction);

// Rotates, shifts and single-bit ops (CpuExecBits.cpp)
ExecResult execRotateAccumulator(Cpu& cpu, const Instruction& instruction);
ExecResult execShift(Cpu& cpu, const Instruction& instruction);
ExecResult execBit(Cpu& cpu, const Instruction& instruction);
ExecResult execSetRes(Cpu& cpu, const Instruction& instruction);

// Control flow and CPU control (CpuExecControl.cpp)
ExecResult execJp(Cpu& cpu, const Instruction& instruction);
ExecResult execJr(Cpu& cpu, const Instruction& instruction);
ExecResult execCall(Cpu& cpu, const Instruction& instruction);
ExecResult execRet(Cpu& cpu, const Instruction& instruction);
ExecResult execReti(Cpu& cpu, const Instruction& instruction);
ExecResult execRst(Cpu& cpu, const Instruction& instruction);
ExecResult execEi(Cpu& cpu, const Instruction& instruction);
ExecResult execDi(Cpu& cpu, const Instruction& instruction);
ExecResult execHalt(Cpu& cpu, const Instruction& instruction);
ExecResult execStop(Cpu& cpu, const Instruction& instruction);
ExecResult execNop(Cpu& cpu, const Instruction& instruction);
ExecResult execInvalid(Cpu& cpu, const Instruction& instruction);

}  // namespace gbcore::cpu::exec_detail
