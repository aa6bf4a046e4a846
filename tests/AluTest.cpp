#include "CpuTestHelpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>

namespace gbcore::cpu {
namespace {

using test_helpers::makeCpu;
using test_helpers::rewind;
using test_helpers::run;
using test_helpers::stepOk;

struct ExpectedFlags {
    bool z;
    bool n;
    bool h;
    bool c;
};

void expectFlags(const Registers& regs, ExpectedFlags expected, unsigned a, unsigned b) {
    EXPECT_EQ(regs.testFlag(Flag::Z), expected.z) << "a=" << a << " b=" << b;
    EXPECT_EQ(regs.testFlag(Flag::N), expected.n) << "a=" << a << " b=" << b;
    EXPECT_EQ(regs.testFlag(Flag::H), expected.h) << "a=" << a << " b=" << b;
    EXPECT_EQ(regs.testFlag(Flag::C), expected.c) << "a=" << a << " b=" << b;
}

/// Runs a single "op A,B" opcode over every operand pair (and both carry-in states).
template <typename Check>
void forAllOperandPairs(uint8_t opcode, Check check) {
    auto cpu = makeCpu({opcode});
    for (unsigned carryIn = 0; carryIn < 2; ++carryIn) {
        for (unsigned a = 0; a < 256; ++a) {
            for (unsigned b = 0; b < 256; ++b) {
                rewind(cpu);
                auto& regs = cpu.registers();
                regs.a = static_cast<uint8_t>(a);
                regs.b = static_cast<uint8_t>(b);
                regs.setFlagsRegister(carryIn != 0 ? 0x10 : 0x00);
                stepOk(cpu);
                check(regs, a, b, carryIn);
                if (::testing::Test::HasFailure()) {
                    return;
                }
            }
        }
    }
}

TEST(AluTest, AddMatchesReference) {
    forAllOperandPairs(0x80, [](const Registers& regs, unsigned a, unsigned b, unsigned) {
        const unsigned sum = a + b;
        EXPECT_EQ(regs.a, sum & 0xFF);
        expectFlags(regs, {(sum & 0xFF) == 0, false, ((a & 0xF) + (b & 0xF)) > 0xF, sum > 0xFF}, a, b);
    });
}

TEST(AluTest, AdcIncludesCarry) {
    forAllOperandPairs(0x88, [](const Registers& regs, unsigned a, unsigned b, unsigned carry) {
        const unsigned sum = a + b + carry;
        EXPECT_EQ(regs.a, sum & 0xFF);
        expectFlags(regs, {(sum & 0xFF) == 0, false, ((a & 0xF) + (b & 0xF) + carry) > 0xF, sum > 0xFF}, a, b);
    });
}

TEST(AluTest, SubMatchesReference) {
    forAllOperandPairs(0x90, [](const Registers& regs, unsigned a, unsigned b, unsigned) {
        const unsigned diff = (a - b) & 0xFF;
        EXPECT_EQ(regs.a, diff);
        expectFlags(regs, {diff == 0, true, (a & 0xF) < (b & 0xF), a < b}, a, b);
    });
}

TEST(AluTest, SbcIncludesBorrow) {
    forAllOperandPairs(0x98, [](const Registers& regs, unsigned a, unsigned b, unsigned carry) {
        const unsigned diff = (a - b - carry) & 0xFF;
        EXPECT_EQ(regs.a, diff);
        expectFlags(regs, {diff == 0, true, (a & 0xF) < (b & 0xF) + carry, a < b + carry}, a, b);
    });
}

TEST(AluTest, CompareLeavesAccumulatorUnchanged) {
    forAllOperandPairs(0xB8, [](const Registers& regs, unsigned a, unsigned b, unsigned) {
        EXPECT_EQ(regs.a, a);
        expectFlags(regs, {a == b, true, (a & 0xF) < (b & 0xF), a < b}, a, b);
    });
}

TEST(AluTest, LogicOpsSetFixedFlags) {
    forAllOperandPairs(0xA0, [](const Registers& regs, unsigned a, unsigned b, unsigned) {
        EXPECT_EQ(regs.a, a & b);
        expectFlags(regs, {(a & b) == 0, false, true, false}, a, b);
    });
    forAllOperandPairs(0xB0, [](const Registers& regs, unsigned a, unsigned b, unsigned) {
        EXPECT_EQ(regs.a, a | b);
        expectFlags(regs, {(a | b) == 0, false, false, false}, a, b);
    });
    forAllOperandPairs(0xA8, [](const Registers& regs, unsigned a, unsigned b, unsigned) {
        EXPECT_EQ(regs.a, a ^ b);
        expectFlags(regs, {(a ^ b) == 0, false, false, false}, a, b);
    });
}

TEST(AluTest, ImmediateAndIndirectSources) {
    auto cpu = run({0x3E, 0x3A, 0xC6, 0xC6});  // LD A,$3A ; ADD A,$C6
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().a, 0x00);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::Z));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));
    EXPECT_EQ(cpu.cycles(), 16u);

    auto indirect = makeCpu({0x86});  // ADD A,(HL)
    indirect.registers().a = 0x10;
    ASSERT_TRUE(indirect.registers().write16(Register::HL, 0xC000).has_value());
    indirect.bus().write(0xC000, 0x22);
    stepOk(indirect);
    EXPECT_EQ(indirect.registers().a, 0x32);
    EXPECT_EQ(indirect.cycles(), 8u);

    auto compare = makeCpu({0xFE, 0x10});  // CP $10
    compare.registers().a = 0x10;
    stepOk(compare);
    EXPECT_EQ(compare.registers().a, 0x10);
    EXPECT_TRUE(compare.registers().testFlag(Flag::Z));
    EXPECT_TRUE(compare.registers().testFlag(Flag::N));
}

TEST(AluTest, IncrementAndDecrementPreserveCarry) {
    auto cpu = makeCpu({0x04, 0x05, 0x05});  // INC B ; DEC B ; DEC B
    cpu.registers().b = 0x0F;
    cpu.registers().writeFlags({{Flag::C, true}});

    stepOk(cpu);
    EXPECT_EQ(cpu.registers().b, 0x10);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::N));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));

    stepOk(cpu);
    EXPECT_EQ(cpu.registers().b, 0x0F);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::N));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));

    cpu.registers().b = 0x01;
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().b, 0x00);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::Z));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));
}

TEST(AluTest, IncrementWrapsToZero) {
    auto cpu = makeCpu({0x3C});  // INC A
    cpu.registers().a = 0xFF;
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().a, 0x00);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::Z));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::C));
}

TEST(AluTest, IncrementIndirectHl) {
    auto cpu = makeCpu({0x34, 0x35});  // INC (HL) ; DEC (HL)
    ASSERT_TRUE(cpu.registers().write16(Register::HL, 0xC100).has_value());
    cpu.bus().write(0xC100, 0x7F);
    stepOk(cpu);
    EXPECT_EQ(cpu.bus().read(0xC100), 0x80);
    EXPECT_EQ(cpu.registers().read(Register::HL), 0xC100);
    EXPECT_EQ(cpu.cycles(), 12u);
    stepOk(cpu);
    EXPECT_EQ(cpu.bus().read(0xC100), 0x7F);
}

TEST(AluTest, WideIncrementAndDecrementTouchNoFlags) {
    auto cpu = makeCpu({0x03, 0x1B});  // INC BC ; DEC DE
    ASSERT_TRUE(cpu.registers().write16(Register::BC, 0xFFFF).has_value());
    cpu.registers().setFlagsRegister(0x50);
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().read(Register::BC), 0x0000);
    EXPECT_EQ(cpu.registers().flagsRegister(), 0x50);
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().read(Register::DE), 0xFFFF);
    EXPECT_EQ(cpu.registers().flagsRegister(), 0x50);
    EXPECT_EQ(cpu.cycles(), 16u);
}

TEST(AluTest, AddHlCarriesFromBits11And15) {
    auto cpu = makeCpu({0x09});  // ADD HL,BC
    ASSERT_TRUE(cpu.registers().write16(Register::HL, 0x0FFF).has_value());
    ASSERT_TRUE(cpu.registers().write16(Register::BC, 0x0001).has_value());
    cpu.registers().writeFlags({{Flag::Z, true}, {Flag::N, true}});
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().read(Register::HL), 0x1000);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::Z));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::N));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::C));

    rewind(cpu);
    ASSERT_TRUE(cpu.registers().write16(Register::HL, 0xFFFF).has_value());
    cpu.registers().writeFlags({{Flag::Z, false}});
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().read(Register::HL), 0x0000);
    EXPECT_FALSE(cpu.registers().testFlag(Flag::Z));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));
}

TEST(AluTest, AddSignedOffsetToStackPointer) {
    auto cpu = makeCpu({0xE8, 0x08});  // ADD SP,+8
    cpu.registers().sp = 0xFFF8;
    cpu.registers().writeFlags({{Flag::Z, true}, {Flag::N, true}});
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().sp, 0x0000);
    EXPECT_FALSE(cpu.registers().testFlag(Flag::Z));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::N));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));
    EXPECT_EQ(cpu.cycles(), 16u);

    auto negative = makeCpu({0xE8, 0xFF});  // ADD SP,-1
    negative.registers().sp = 0x0000;
    stepOk(negative);
    EXPECT_EQ(negative.registers().sp, 0xFFFF);
    EXPECT_FALSE(negative.registers().testFlag(Flag::H));
    EXPECT_FALSE(negative.registers().testFlag(Flag::C));
}

unsigned toBcd(unsigned value) {
    return ((value / 10) << 4) | (value % 10);
}

TEST(AluTest, DaaCorrectsAdditionToPackedBcd) {
    auto cpu = makeCpu({0x80, 0x27});  // ADD A,B ; DAA
    for (unsigned x = 0; x < 100; ++x) {
        for (unsigned y = 0; y < 100; ++y) {
            rewind(cpu);
            cpu.registers().a = static_cast<uint8_t>(toBcd(x));
            cpu.registers().b = static_cast<uint8_t>(toBcd(y));
            stepOk(cpu);
            stepOk(cpu);
            const unsigned sum = x + y;
            ASSERT_EQ(cpu.registers().a, toBcd(sum % 100)) << x << " + " << y;
            ASSERT_EQ(cpu.registers().testFlag(Flag::C), sum >= 100) << x << " + " << y;
            ASSERT_EQ(cpu.registers().testFlag(Flag::Z), sum % 100 == 0) << x << " + " << y;
            ASSERT_FALSE(cpu.registers().testFlag(Flag::H));
        }
    }
}

TEST(AluTest, DaaCorrectsSubtractionToPackedBcd) {
    auto cpu = makeCpu({0x90, 0x27});  // SUB B ; DAA
    for (unsigned x = 0; x < 100; ++x) {
        for (unsigned y = 0; y < 100; ++y) {
            rewind(cpu);
            cpu.registers().a = static_cast<uint8_t>(toBcd(x));
            cpu.registers().b = static_cast<uint8_t>(toBcd(y));
            stepOk(cpu);
            stepOk(cpu);
            const unsigned diff = (x + 100 - y) % 100;
            ASSERT_EQ(cpu.registers().a, toBcd(diff)) << x << " - " << y;
            ASSERT_EQ(cpu.registers().testFlag(Flag::C), x < y) << x << " - " << y;
            ASSERT_TRUE(cpu.registers().testFlag(Flag::N));
        }
    }
}

TEST(AluTest, ComplementAndCarryFlagOps) {
    auto cpu = makeCpu({0x2F, 0x37, 0x3F});  // CPL ; SCF ; CCF
    cpu.registers().a = 0x35;
    cpu.registers().writeFlags({{Flag::Z, true}});
    stepOk(cpu);
    EXPECT_EQ(cpu.registers().a, 0xCA);
    EXPECT_TRUE(cpu.registers().testFlag(Flag::N));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::Z));

    stepOk(cpu);
    EXPECT_FALSE(cpu.registers().testFlag(Flag::N));
    EXPECT_FALSE(cpu.registers().testFlag(Flag::H));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::C));

    stepOk(cpu);
    EXPECT_FALSE(cpu.registers().testFlag(Flag::C));
    EXPECT_TRUE(cpu.registers().testFlag(Flag::Z));
}

}  // namespace
}  // namespace gbcore::cpu
