#include "gbcore/cpu/Decoder.hpp"

#include "gbcore/cpu/OpcodeTable.hpp"

namespace gbcore::cpu {

std::optional<uint8_t> BusReader::next() {
    if (position_ >= kEnd) {
        return std::nullopt;
    }
    const uint8_t value = bus_.read(static_cast<uint16_t>(position_));
    ++position_;
    return value;
}

std::expected<Instruction, CpuError> decodeInstruction(const bus::Bus& bus, uint16_t address) {
    BusReader reader(bus, address);

    const auto opcode = reader.next();
    if (!opcode.has_value()) {
        return std::unexpected(CpuError::UnexpectedEndOfData);
    }

    Instruction instruction;
    instruction.address = address;
    instruction.bytes[0] = *opcode;

    if (*opcode == kExtendedPrefix) {
        const auto extended = reader.next();
        if (!extended.has_value()) {
            return std::unexpected(CpuError::UnexpectedEndOfData);
        }
        instruction.bytes[1] = *extended;
        instruction.extended = true;
        instruction.def = &extendedOpcode(*extended);
        instruction.length = instruction.def->length;
        return instruction;
    }

    instruction.def = &primaryOpcode(*opcode);
    instruction.length = instruction.def->length;

    // Operand bytes are captured here so executors can read them without touching the bus again.
    for (uint8_t i = 1; i < instruction.length; ++i) {
        const auto value = reader.next();
        if (!value.has_value()) {
            return std::unexpected(CpuError::UnexpectedEndOfData);
        }
        instruction.bytes[i] = *value;
    }

    return instruction;
}

}  // namespace gbcore::cpu
