#include "gbcore/cpu/OpcodeTable.hpp"

#include <array>

namespace gbcore::cpu {
namespace {

using R = Register;
using M = Mnemonic;
using K = OperandKind;

constexpr Operand none() {
    return {};
}

constexpr Operand reg(R r) {
    return {K::Register, r, 0};
}

constexpr Operand ind(R r) {
    return {K::RegisterIndirect, r, 0};
}

constexpr Operand kind(K k) {
    return {k, R::A, 0};
}

constexpr Operand kindReg(K k, R r) {
    return {k, r, 0};
}

constexpr Operand d8() {
    return kind(K::Immediate8);
}

constexpr Operand d16() {
    return kind(K::Immediate16);
}

constexpr Operand a16() {
    return kind(K::AbsoluteIndirect);
}

constexpr Operand e8() {
    return kind(K::Relative);
}

constexpr Operand bitIndex(uint8_t bit) {
    return {K::BitIndex, R::A, bit};
}

constexpr Operand vector(uint8_t target) {
    return {K::Vector, R::A, target};
}

// Register encoding used by the 3-bit r fields: B C D E H L (HL) A.
constexpr std::array<R, 8> kR8 = {R::B, R::C, R::D, R::E, R::H, R::L, R::HL, R::A};
constexpr uint8_t kIndirectHlIndex = 6;

constexpr Operand r8(uint8_t index) {
    return index == kIndirectHlIndex ? ind(R::HL) : reg(kR8[index]);
}

constexpr OpcodeDef op(M mnemonic, uint8_t length, uint8_t cycles, Operand first = none(),
                       Operand second = none()) {
    return OpcodeDef{mnemonic, Condition::Always, {first, second}, length, cycles, 0};
}

constexpr OpcodeDef branch(M mnemonic, Condition condition, uint8_t length, uint8_t notTaken, uint8_t taken,
                           Operand target = none()) {
    return OpcodeDef{mnemonic, condition, {target, none()}, length, notTaken, taken};
}

constexpr OpcodeDef aluOp(uint8_t group, Operand source, uint8_t length, uint8_t cycles) {
    switch (group) {
    case 0:
        return op(M::Add, length, cycles, reg(R::A), source);
    case 1:
        return op(M::Adc, length, cycles, reg(R::A), source);
    case 2:
        return op(M::Sub, length, cycles, source);
    case 3:
        return op(M::Sbc, length, cycles, reg(R::A), source);
    case 4:
        return op(M::And, length, cycles, source);
    case 5:
        return op(M::Xor, length, cycles, source);
    case 6:
        return op(M::Or, length, cycles, source);
    default:
        return op(M::Cp, length, cycles, source);
    }
}

constexpr OpcodeDef primaryDef(uint8_t opcode) {
    if (opcode == 0x76) {
        return op(M::Halt, 1, 4);
    }
    if (opcode >= 0x40 && opcode < 0x80) {
        const uint8_t dst = (opcode >> 3) & 0x07;
        const uint8_t src = opcode & 0x07;
        const bool touchesMemory = dst == kIndirectHlIndex || src == kIndirectHlIndex;
        return op(M::Ld, 1, touchesMemory ? 8 : 4, r8(dst), r8(src));
    }
    if (opcode >= 0x80 && opcode < 0xC0) {
        const uint8_t src = opcode & 0x07;
        return aluOp((opcode >> 3) & 0x07, r8(src), 1, src == kIndirectHlIndex ? 8 : 4);
    }

    switch (opcode) {
    case 0x00:
        return op(M::Nop, 1, 4);
    case 0x01:
        return op(M::Ld, 3, 12, reg(R::BC), d16());
    case 0x02:
        return op(M::Ld, 1, 8, ind(R::BC), reg(R::A));
    case 0x03:
        return op(M::Inc, 1, 8, reg(R::BC));
    case 0x04:
        return op(M::Inc, 1, 4, reg(R::B));
    case 0x05:
        return op(M::Dec, 1, 4, reg(R::B));
    case 0x06:
        return op(M::Ld, 2, 8, reg(R::B), d8());
    case 0x07:
        return op(M::Rlca, 1, 4);
    case 0x08:
        return op(M::Ld, 3, 20, a16(), reg(R::SP));
    case 0x09:
        return op(M::Add, 1, 8, reg(R::HL), reg(R::BC));
    case 0x0A:
        return op(M::Ld, 1, 8, reg(R::A), ind(R::BC));
    case 0x0B:
        return op(M::Dec, 1, 8, reg(R::BC));
    case 0x0C:
        return op(M::Inc, 1, 4, reg(R::C));
    case 0x0D:
        return op(M::Dec, 1, 4, reg(R::C));
    case 0x0E:
        return op(M::Ld, 2, 8, reg(R::C), d8());
    case 0x0F:
        return op(M::Rrca, 1, 4);

    case 0x10:
        return op(M::Stop, 2, 4, d8());
    case 0x11:
        return op(M::Ld, 3, 12, reg(R::DE), d16());
    case 0x12:
        return op(M::Ld, 1, 8, ind(R::DE), reg(R::A));
    case 0x13:
        return op(M::Inc, 1, 8, reg(R::DE));
    case 0x14:
        return op(M::Inc, 1, 4, reg(R::D));
    case 0x15:
        return op(M::Dec, 1, 4, reg(R::D));
    case 0x16:
        return op(M::Ld, 2, 8, reg(R::D), d8());
    case 0x17:
        return op(M::Rla, 1, 4);
    case 0x18:
        return op(M::Jr, 2, 12, e8());
    case 0x19:
        return op(M::Add, 1, 8, reg(R::HL), reg(R::DE));
    case 0x1A:
        return op(M::Ld, 1, 8, reg(R::A), ind(R::DE));
    case 0x1B:
        return op(M::Dec, 1, 8, reg(R::DE));
    case 0x1C:
        return op(M::Inc, 1, 4, reg(R::E));
    case 0x1D:
        return op(M::Dec, 1, 4, reg(R::E));
    case 0x1E:
        return op(M::Ld, 2, 8, reg(R::E), d8());
    case 0x1F:
        return op(M::Rra, 1, 4);

    case 0x20:
        return branch(M::Jr, Condition::NZ, 2, 8, 12, e8());
    case 0x21:
        return op(M::Ld, 3, 12, reg(R::HL), d16());
    case 0x22:
        return op(M::Ld, 1, 8, kindReg(K::RegisterIndirectInc, R::HL), reg(R::A));
    case 0x23:
        return op(M::Inc, 1, 8, reg(R::HL));
    case 0x24:
        return op(M::Inc, 1, 4, reg(R::H));
    case 0x25:
        return op(M::Dec, 1, 4, reg(R::H));
    case 0x26:
        return op(M::Ld, 2, 8, reg(R::H), d8());
    case 0x27:
        return op(M::Daa, 1, 4);
    case 0x28:
        return branch(M::Jr, Condition::Z, 2, 8, 12, e8());
    case 0x29:
        return op(M::Add, 1, 8, reg(R::HL), reg(R::HL));
    case 0x2A:
        return op(M::Ld, 1, 8, reg(R::A), kindReg(K::RegisterIndirectInc, R::HL));
    case 0x2B:
        return op(M::Dec, 1, 8, reg(R::HL));
    case 0x2C:
        return op(M::Inc, 1, 4, reg(R::L));
    case 0x2D:
        return op(M::Dec, 1, 4, reg(R::L));
    case 0x2E:
        return op(M::Ld, 2, 8, reg(R::L), d8());
    case 0x2F:
        return op(M::Cpl, 1, 4);

    case 0x30:
        return branch(M::Jr, Condition::NC, 2, 8, 12, e8());
    case 0x31:
        return op(M::Ld, 3, 12, reg(R::SP), d16());
    case 0x32:
        return op(M::Ld, 1, 8, kindReg(K::RegisterIndirectDec, R::HL), reg(R::A));
    case 0x33:
        return op(M::Inc, 1, 8, reg(R::SP));
    case 0x34:
        return op(M::Inc, 1, 12, ind(R::HL));
    case 0x35:
        return op(M::Dec, 1, 12, ind(R::HL));
    case 0x36:
        return op(M::Ld, 2, 12, ind(R::HL), d8());
    case 0x37:
        return op(M::Scf, 1, 4);
    case 0x38:
        return branch(M::Jr, Condition::C, 2, 8, 12, e8());
    case 0x39:
        return op(M::Add, 1, 8, reg(R::HL), reg(R::SP));
    case 0x3A:
        return op(M::Ld, 1, 8, reg(R::A), kindReg(K::RegisterIndirectDec, R::HL));
    case 0x3B:
        return op(M::Dec, 1, 8, reg(R::SP));
    case 0x3C:
        return op(M::Inc, 1, 4, reg(R::A));
    case 0x3D:
        return op(M::Dec, 1, 4, reg(R::A));
    case 0x3E:
        return op(M::Ld, 2, 8, reg(R::A), d8());
    case 0x3F:
        return op(M::Ccf, 1, 4);

    case 0xC0:
        return branch(M::Ret, Condition::NZ, 1, 8, 20);
    case 0xC1:
        return op(M::Pop, 1, 12, reg(R::BC));
    case 0xC2:
        return branch(M::Jp, Condition::NZ, 3, 12, 16, d16());
    case 0xC3:
        return op(M::Jp, 3, 16, d16());
    case 0xC4:
        return branch(M::Call, Condition::NZ, 3, 12, 24, d16());
    case 0xC5:
        return op(M::Push, 1, 16, reg(R::BC));
    case 0xC6:
        return aluOp(0, d8(), 2, 8);
    case 0xC7:
        return op(M::Rst, 1, 16, vector(0x00));
    case 0xC8:
        return branch(M::Ret, Condition::Z, 1, 8, 20);
    case 0xC9:
        return op(M::Ret, 1, 16);
    case 0xCA:
        return branch(M::Jp, Condition::Z, 3, 12, 16, d16());
    case 0xCB:
        return op(M::Prefix, 1, 4);
    case 0xCC:
        return branch(M::Call, Condition::Z, 3, 12, 24, d16());
    case 0xCD:
        return op(M::Call, 3, 24, d16());
    case 0xCE:
        return aluOp(1, d8(), 2, 8);
    case 0xCF:
        return op(M::Rst, 1, 16, vector(0x08));

    case 0xD0:
        return branch(M::Ret, Condition::NC, 1, 8, 20);
    case 0xD1:
        return op(M::Pop, 1, 12, reg(R::DE));
    case 0xD2:
        return branch(M::Jp, Condition::NC, 3, 12, 16, d16());
    case 0xD4:
        return branch(M::Call, Condition::NC, 3, 12, 24, d16());
    case 0xD5:
        return op(M::Push, 1, 16, reg(R::DE));
    case 0xD6:
        return aluOp(2, d8(), 2, 8);
    case 0xD7:
        return op(M::Rst, 1, 16, vector(0x10));
    case 0xD8:
        return branch(M::Ret, Condition::C, 1, 8, 20);
    case 0xD9:
        return op(M::Reti, 1, 16);
    case 0xDA:
        return branch(M::Jp, Condition::C, 3, 12, 16, d16());
    case 0xDC:
        return branch(M::Call, Condition::C, 3, 12, 24, d16());
    case 0xDE:
        return aluOp(3, d8(), 2, 8);
    case 0xDF:
        return op(M::Rst, 1, 16, vector(0x18));

    case 0xE0:
        return op(M::Ldh, 2, 12, kind(K::HighImmediateIndirect), reg(R::A));
    case 0xE1:
        return op(M::Pop, 1, 12, reg(R::HL));
    case 0xE2:
        return op(M::Ld, 1, 8, kindReg(K::HighRegisterIndirect, R::C), reg(R::A));
    case 0xE5:
        return op(M::Push, 1, 16, reg(R::HL));
    case 0xE6:
        return aluOp(4, d8(), 2, 8);
    case 0xE7:
        return op(M::Rst, 1, 16, vector(0x20));
    case 0xE8:
        return op(M::Add, 2, 16, reg(R::SP), kind(K::SignedImmediate8));
    case 0xE9:
        return op(M::Jp, 1, 4, reg(R::HL));
    case 0xEA:
        return op(M::Ld, 3, 16, a16(), reg(R::A));
    case 0xEE:
        return aluOp(5, d8(), 2, 8);
    case 0xEF:
        return op(M::Rst, 1, 16, vector(0x28));

    case 0xF0:
        return op(M::Ldh, 2, 12, reg(R::A), kind(K::HighImmediateIndirect));
    case 0xF1:
        return op(M::Pop, 1, 12, reg(R::AF));
    case 0xF2:
        return op(M::Ld, 1, 8, reg(R::A), kindReg(K::HighRegisterIndirect, R::C));
    case 0xF3:
        return op(M::Di, 1, 4);
    case 0xF5:
        return op(M::Push, 1, 16, reg(R::AF));
    case 0xF6:
        return aluOp(6, d8(), 2, 8);
    case 0xF7:
        return op(M::Rst, 1, 16, vector(0x30));
    case 0xF8:
        return op(M::Ld, 2, 12, reg(R::HL), kind(K::StackRelative));
    case 0xF9:
        return op(M::Ld, 1, 8, reg(R::SP), reg(R::HL));
    case 0xFA:
        return op(M::Ld, 3, 16, reg(R::A), a16());
    case 0xFB:
        return op(M::Ei, 1, 4);
    case 0xFE:
        return aluOp(7, d8(), 2, 8);
    case 0xFF:
        return op(M::Rst, 1, 16, vector(0x38));

    default:
        // D3 DB DD E3 E4 EB EC ED F4 FC FD
        return op(M::Invalid, 1, 4);
    }
}

constexpr OpcodeDef extendedDef(uint8_t opcode) {
    constexpr std::array<M, 8> kShiftOps = {M::Rlc, M::Rrc, M::Rl, M::Rr, M::Sla, M::Sra, M::Swap, M::Srl};

    const uint8_t index = opcode & 0x07;
    const uint8_t bit = (opcode >> 3) & 0x07;
    const Operand target = r8(index);
    const bool memory = index == kIndirectHlIndex;

    switch (opcode >> 6) {
    case 0:
        return op(kShiftOps[bit], 2, memory ? 16 : 8, target);
    case 1:
        return op(M::Bit, 2, memory ? 12 : 8, bitIndex(bit), target);
    case 2:
        return op(M::Res, 2, memory ? 16 : 8, bitIndex(bit), target);
    default:
        return op(M::Set, 2, memory ? 16 : 8, bitIndex(bit), target);
    }
}

template <typename Builder>
constexpr std::array<OpcodeDef, 256> buildTable(Builder builder) {
    std::array<OpcodeDef, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = builder(static_cast<uint8_t>(i));
    }
    return table;
}

constexpr auto kPrimaryTable = buildTable(primaryDef);
constexpr auto kExtendedTable = buildTable(extendedDef);

static_assert(kPrimaryTable[0x31].length == 3 && kPrimaryTable[0x31].cycles == 12);
static_assert(kPrimaryTable[0xD3].mnemonic == Mnemonic::Invalid);
static_assert(kExtendedTable[0x46].cycles == 12);

}  // namespace

const OpcodeDef& primaryOpcode(uint8_t opcode) noexcept {
    return kPrimaryTable[opcode];
}

const OpcodeDef& extendedOpcode(uint8_t opcode) noexcept {
    return kExtendedTable[opcode];
}

}  // namespace gbcore::cpu
