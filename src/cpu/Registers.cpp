#include "gbcore/cpu/Registers.hpp"

namespace gbcore::cpu {
namespace {

constexpr uint16_t makeWord(uint8_t high, uint8_t low) {
    return static_cast<uint16_t>((static_cast<uint16_t>(high) << 8) | low);
}

constexpr uint8_t highByte(uint16_t value) {
    return static_cast<uint8_t>(value >> 8);
}

constexpr uint8_t lowByte(uint16_t value) {
    return static_cast<uint8_t>(value & 0xFFu);
}

bool isAddressPair(Register reg) {
    return reg == Register::BC || reg == Register::DE || reg == Register::HL || reg == Register::SP;
}

}  // namespace

std::string_view registerName(Register reg) noexcept {
    switch (reg) {
    case Register::A:
        return "A";
    case Register::F:
        return "F";
    case Register::B:
        return "B";
    case Register::C:
        return "C";
    case Register::D:
        return "D";
    case Register::E:
        return "E";
    case Register::H:
        return "H";
    case Register::L:
        return "L";
    case Register::AF:
        return "AF";
    case Register::BC:
        return "BC";
    case Register::DE:
        return "DE";
    case Register::HL:
        return "HL";
    case Register::SP:
        return "SP";
    case Register::PC:
        return "PC";
    }
    return "?";
}

uint8_t* Registers::narrow(Register reg) noexcept {
    return const_cast<uint8_t*>(static_cast<const Registers*>(this)->narrow(reg));
}

const uint8_t* Registers::narrow(Register reg) const noexcept {
    switch (reg) {
    case Register::A:
        return &a;
    case Register::B:
        return &b;
    case Register::C:
        return &c;
    case Register::D:
        return &d;
    case Register::E:
        return &e;
    case Register::H:
        return &h;
    case Register::L:
        return &l;
    default:
        return nullptr;
    }
}

uint16_t Registers::read(Register reg) const noexcept {
    switch (reg) {
    case Register::F:
        return f_;
    case Register::AF:
        return makeWord(a, f_);
    case Register::BC:
        return makeWord(b, c);
    case Register::DE:
        return makeWord(d, e);
    case Register::HL:
        return makeWord(h, l);
    case Register::SP:
        return sp;
    case Register::PC:
        return pc;
    default:
        return *narrow(reg);
    }
}

std::expected<void, CpuError> Registers::write(Register reg, uint16_t value) {
    if (isWideRegister(reg)) {
        return write16(reg, value);
    }
    if (value > 0xFF) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    return write8(reg, static_cast<uint8_t>(value));
}

std::expected<uint8_t, CpuError> Registers::read8(Register reg) const {
    if (isWideRegister(reg)) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    return static_cast<uint8_t>(read(reg));
}

std::expected<void, CpuError> Registers::write8(Register reg, uint8_t value) {
    if (reg == Register::F) {
        setFlagsRegister(value);
        return {};
    }
    uint8_t* target = narrow(reg);
    if (target == nullptr) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    *target = value;
    return {};
}

std::expected<uint16_t, CpuError> Registers::read16(Register reg) const {
    if (!isWideRegister(reg)) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    return read(reg);
}

std::expected<void, CpuError> Registers::write16(Register reg, uint16_t value) {
    switch (reg) {
    case Register::AF:
        a = highByte(value);
        setFlagsRegister(lowByte(value));
        return {};
    case Register::BC:
        b = highByte(value);
        c = lowByte(value);
        return {};
    case Register::DE:
        d = highByte(value);
        e = lowByte(value);
        return {};
    case Register::HL:
        h = highByte(value);
        l = lowByte(value);
        return {};
    case Register::SP:
        sp = value;
        return {};
    case Register::PC:
        pc = value;
        return {};
    default:
        return std::unexpected(CpuError::UnsupportedOperand);
    }
}

std::expected<uint16_t, CpuError> Registers::readThenDecrement(Register pair) {
    if (!isAddressPair(pair)) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    const uint16_t value = read(pair);
    return write16(pair, static_cast<uint16_t>(value - 1)).transform([value] { return value; });
}

std::expected<uint16_t, CpuError> Registers::readThenIncrement(Register pair) {
    if (!isAddressPair(pair)) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    const uint16_t value = read(pair);
    return write16(pair, static_cast<uint16_t>(value + 1)).transform([value] { return value; });
}

std::expected<uint16_t, CpuError> Registers::incrementThenRead(Register pair) {
    if (!isAddressPair(pair)) {
        return std::unexpected(CpuError::UnsupportedOperand);
    }
    const auto value = static_cast<uint16_t>(read(pair) + 1);
    return write16(pair, value).transform([value] { return value; });
}

void Registers::writeFlags(std::initializer_list<FlagWrite> flags) noexcept {
    for (const auto& [flag, value] : flags) {
        const auto bit = static_cast<uint8_t>(flag);
        if (value) {
            f_ = static_cast<uint8_t>(f_ | bit);
        } else {
            f_ = static_cast<uint8_t>(f_ & ~bit);
        }
    }
}

}  // namespace gbcore::cpu
