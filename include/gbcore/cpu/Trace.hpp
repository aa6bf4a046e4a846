#pragma once

#include "gbcore/cpu/Cpu.hpp"
#include "gbcore/cpu/CpuError.hpp"
#include "gbcore/cpu/Registers.hpp"

#include <expected>
#include <ostream>
#include <string>

namespace gbcore::cpu {

/// "A=01 F=B0 B=00 C=13 D=00 E=D8 H=01 L=4D SP=FFFE"
[[nodiscard]] std::string formatRegisters(const Registers& regs);

/// @brief Step once and write one trace line: address, bytes, disassembly, registers after, cycles taken.
/// Nothing is written when the instruction at PC cannot be decoded. A line whose instruction then
/// faults is terminated without the register suffix.
std::expected<void, CpuError> traceStep(Cpu& cpu, std::ostream& out);

}  // namespace gbcore::cpu
