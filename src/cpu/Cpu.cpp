#include "gbcore/cpu/Cpu.hpp"

#include "CpuExecShared.hpp"
#include "gbcore/common/Logger.hpp"
#include "gbcore/cpu/Decoder.hpp"
#include "gbcore/cpu/Executor.hpp"

#include <format>
#include <utility>

namespace gbcore::cpu {
namespace {

void reportFault(uint16_t pc, const Instruction* instruction, CpuError error) {
    if (instruction == nullptr) {
        common::Logger::logError(std::format("CPU fault at ${:04X}: {}", pc, cpuErrorToString(error)));
        return;
    }
    common::Logger::logError(std::format("CPU fault at ${:04X} [{}] {}: {}", pc, formatInstructionBytes(*instruction),
                                         formatInstruction(*instruction), cpuErrorToString(error)));
}

}  // namespace

Cpu::Cpu(std::unique_ptr<bus::Bus> bus) : bus_(std::move(bus)) {}

std::expected<Instruction, CpuError> Cpu::peekNextInstruction() const {
    return decodeInstruction(*bus_, regs_.pc);
}

std::expected<void, CpuError> Cpu::step() {
    if (runState_ != RunState::Running) {
        return {};
    }

    const auto instruction = peekNextInstruction();
    if (!instruction.has_value()) {
        reportFault(regs_.pc, nullptr, instruction.error());
        return std::unexpected(instruction.error());
    }

    const auto result = executeInstruction(*this, *instruction);
    if (!result.has_value()) {
        reportFault(regs_.pc, &*instruction, result.error());
        return std::unexpected(result.error());
    }

    regs_.pc = result->pc;
    cycles_ += result->cycles;

    if (imeEnableDelay_ != 0 && --imeEnableDelay_ == 0) {
        ime_ = true;
    }
    return {};
}

void Cpu::setInterruptsEnabled(bool enabled) noexcept {
    ime_ = enabled;
    imeEnableDelay_ = 0;
}

bool Cpu::serviceInterrupt(uint16_t vector) {
    runState_ = RunState::Running;
    if (!ime_) {
        return false;
    }

    setInterruptsEnabled(false);
    exec_detail::push16(*this, regs_.pc);
    regs_.pc = vector;
    cycles_ += kInterruptDispatchCycles;
    return true;
}

void Cpu::applyProfile(const CpuProfile& profile) {
    regs_.a = profile.a;
    regs_.setFlagsRegister(profile.f);
    regs_.b = profile.b;
    regs_.c = profile.c;
    regs_.d = profile.d;
    regs_.e = profile.e;
    regs_.h = profile.h;
    regs_.l = profile.l;
    regs_.sp = profile.sp;
    regs_.pc = profile.pc;
}

}  // namespace gbcore::cpu
