#pragma once

#include "gbcore/bus/Bus.hpp"
#include "gbcore/cpu/CpuError.hpp"
#include "gbcore/cpu/CpuProfile.hpp"
#include "gbcore/cpu/Instruction.hpp"
#include "gbcore/cpu/Registers.hpp"

#include <cstdint>
#include <expected>
#include <memory>

namespace gbcore::cpu {

enum class RunState : uint8_t {
    Running,
    Halted,   ///< HALT: no fetch until an interrupt wakes the CPU
    Stopped,  ///< STOP: no fetch until an external wake-up
};

/// Outcome of executing one instruction.
struct OpResult {
    uint16_t pc = 0;      ///< Program counter after the instruction
    uint32_t cycles = 0;  ///< Clock cycles actually consumed
};

/// SM83 fetch-decode-execute engine.
class Cpu {
public:
    /// Cycles taken to dispatch an interrupt.
    static constexpr uint32_t kInterruptDispatchCycles = 20;

    explicit Cpu(std::unique_ptr<bus::Bus> bus);

    Cpu(const Cpu&) = delete;
    Cpu& operator=(const Cpu&) = delete;
    Cpu(Cpu&&) noexcept = default;
    Cpu& operator=(Cpu&&) noexcept = default;

    /// @brief Fetch, decode and execute one instruction.
    /// Does nothing while halted or stopped. On failure PC and the cycle counter are left untouched.
    std::expected<void, CpuError> step();

    /// @brief Decode the instruction at PC without executing it.
    [[nodiscard]] std::expected<Instruction, CpuError> peekNextInstruction() const;

    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_; }

    [[nodiscard]] RunState runState() const noexcept { return runState_; }
    void setRunState(RunState state) noexcept { runState_ = state; }

    // ========== Interrupt master enable ==========

    [[nodiscard]] bool interruptsEnabled() const noexcept { return ime_; }
    void setInterruptsEnabled(bool enabled) noexcept;

    /// @brief True while an EI is waiting for the following instruction to complete.
    [[nodiscard]] bool interruptEnablePending() const noexcept { return imeEnableDelay_ != 0; }

    /// @brief Arm the delayed enable performed by EI.
    void scheduleInterruptEnable() noexcept { imeEnableDelay_ = 2; }

    /// @brief Dispatch an interrupt on behalf of the interrupt controller.
    /// Always wakes a halted/stopped CPU. When IME is set, pushes PC, jumps to the vector, clears IME and
    /// returns true.
    bool serviceInterrupt(uint16_t vector);

    /// @brief Load the register state of a boot profile.
    void applyProfile(const CpuProfile& profile);

    Registers& registers() noexcept { return regs_; }
    [[nodiscard]] const Registers& registers() const noexcept { return regs_; }

    bus::Bus& bus() noexcept { return *bus_; }
    [[nodiscard]] const bus::Bus& bus() const noexcept { return *bus_; }

private:
    std::unique_ptr<bus::Bus> bus_;
    Registers regs_;
    uint64_t cycles_ = 0;
    RunState runState_ = RunState::Running;
    bool ime_ = false;
    uint8_t imeEnableDelay_ = 0;
};

}  // namespace gbcore::cpu
