#pragma once

#include <cstdint>

namespace gbcore::bus {

/// Byte-addressed view of the 16-bit address space seen by the CPU.
///
/// Implementations own whatever is mapped behind an address (ROM, RAM, I/O registers). Both operations are
/// total: out-of-range or unmapped accesses are the implementation's concern and never fail back into the CPU.
class Bus {
public:
    virtual ~Bus() = default;

    [[nodiscard]] virtual uint8_t read(uint16_t address) const = 0;
    virtual void write(uint16_t address, uint8_t value) = 0;

protected:
    Bus() = default;
};

}  // namespace gbcore::bus
