#include "gbcore/cpu/Trace.hpp"

#include <cstdint>
#include <format>

namespace gbcore::cpu {

std::string formatRegisters(const Registers& regs) {
    return std::format("A={:02X} F={:02X} B={:02X} C={:02X} D={:02X} E={:02X} H={:02X} L={:02X} SP={:04X}", regs.a,
                       regs.flagsRegister(), regs.b, regs.c, regs.d, regs.e, regs.h, regs.l, regs.sp);
}

std::expected<void, CpuError> traceStep(Cpu& cpu, std::ostream& out) {
    const uint64_t cyclesBefore = cpu.cycles();
    const auto next = cpu.peekNextInstruction();
    const bool wrotePrefix = next.has_value();
    if (wrotePrefix) {
        out << std::format("{:04X}  {:<8}  {:<18}  ", next->address, formatInstructionBytes(*next),
                           formatInstruction(*next));
    }

    const auto stepped = cpu.step();
    if (!stepped.has_value()) {
        if (wrotePrefix) {
            out << '\n';
        }
        return stepped;
    }

    if (wrotePrefix) {
        out << std::format("{}  +{}\n", formatRegisters(cpu.registers()), cpu.cycles() - cyclesBefore);
    }
    return {};
}

}  // namespace gbcore::cpu
