#pragma once

#include "gbcore/cpu/Cpu.hpp"
#include "gbcore/cpu/CpuError.hpp"
#include "gbcore/cpu/Instruction.hpp"

#include <expected>

namespace gbcore::cpu {

/// @brief Run the executor for the instruction's mnemonic against the CPU state.
/// Registers and bus are mutated in place; PC and the cycle counter are not. The returned OpResult carries
/// the next PC and the cycles consumed for the caller to commit.
std::expected<OpResult, CpuError> executeInstruction(Cpu& cpu, const Instruction& instruction);

}  // namespace gbcore::cpu
