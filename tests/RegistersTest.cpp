#include "gbcore/cpu/Registers.hpp"

#include <gtest/gtest.h>

namespace gbcore::cpu {
namespace {

TEST(RegistersTest, PairsCombineHighAndLowHalves) {
    Registers regs;
    regs.b = 0x12;
    regs.c = 0x34;
    regs.d = 0x56;
    regs.e = 0x78;
    regs.h = 0x9A;
    regs.l = 0xBC;
    EXPECT_EQ(regs.read(Register::BC), 0x1234);
    EXPECT_EQ(regs.read(Register::DE), 0x5678);
    EXPECT_EQ(regs.read(Register::HL), 0x9ABC);

    ASSERT_TRUE(regs.write16(Register::HL, 0xC0DE).has_value());
    EXPECT_EQ(regs.h, 0xC0);
    EXPECT_EQ(regs.l, 0xDE);
}

TEST(RegistersTest, FlagsLowNibbleAlwaysZero) {
    Registers regs;
    regs.setFlagsRegister(0xFF);
    EXPECT_EQ(regs.flagsRegister(), 0xF0);

    ASSERT_TRUE(regs.write16(Register::AF, 0x12FF).has_value());
    EXPECT_EQ(regs.a, 0x12);
    EXPECT_EQ(regs.read(Register::AF), 0x12F0);

    ASSERT_TRUE(regs.write8(Register::F, 0x0F).has_value());
    EXPECT_EQ(regs.read(Register::F), 0x00);
}

TEST(RegistersTest, WriteFlagsTouchesOnlyNamedFlags) {
    Registers regs;
    regs.setFlagsRegister(0x50);  // N and C
    regs.writeFlags({{Flag::Z, true}, {Flag::C, false}});
    EXPECT_TRUE(regs.testFlag(Flag::Z));
    EXPECT_TRUE(regs.testFlag(Flag::N));
    EXPECT_FALSE(regs.testFlag(Flag::H));
    EXPECT_FALSE(regs.testFlag(Flag::C));
    EXPECT_EQ(regs.flagsRegister(), 0xC0);
}

TEST(RegistersTest, WidthMismatchIsRejected) {
    Registers regs;
    EXPECT_FALSE(regs.read8(Register::HL).has_value());
    EXPECT_FALSE(regs.read16(Register::A).has_value());
    EXPECT_FALSE(regs.write8(Register::SP, 0x01).has_value());
    EXPECT_FALSE(regs.write16(Register::B, 0x0001).has_value());

    const auto tooWide = regs.write(Register::A, 0x100);
    ASSERT_FALSE(tooWide.has_value());
    EXPECT_EQ(tooWide.error(), CpuError::UnsupportedOperand);
    EXPECT_EQ(regs.a, 0);

    ASSERT_TRUE(regs.write(Register::A, 0xFF).has_value());
    ASSERT_TRUE(regs.write(Register::SP, 0xFFFE).has_value());
    EXPECT_EQ(regs.a, 0xFF);
    EXPECT_EQ(regs.sp, 0xFFFE);
}

TEST(RegistersTest, AutoIncrementAndDecrementHelpers) {
    Registers regs;
    ASSERT_TRUE(regs.write16(Register::HL, 0x00FF).has_value());

    EXPECT_EQ(regs.readThenIncrement(Register::HL), 0x00FF);
    EXPECT_EQ(regs.read(Register::HL), 0x0100);

    EXPECT_EQ(regs.readThenDecrement(Register::HL), 0x0100);
    EXPECT_EQ(regs.read(Register::HL), 0x00FF);

    EXPECT_EQ(regs.incrementThenRead(Register::HL), 0x0100);
    EXPECT_EQ(regs.read(Register::HL), 0x0100);

    regs.sp = 0xFFFF;
    EXPECT_EQ(regs.incrementThenRead(Register::SP), 0x0000);

    EXPECT_FALSE(regs.readThenIncrement(Register::AF).has_value());
    EXPECT_FALSE(regs.readThenDecrement(Register::A).has_value());
}

TEST(RegistersTest, Names) {
    EXPECT_EQ(registerName(Register::A), "A");
    EXPECT_EQ(registerName(Register::HL), "HL");
    EXPECT_EQ(registerName(Register::PC), "PC");
    EXPECT_TRUE(isWideRegister(Register::AF));
    EXPECT_FALSE(isWideRegister(Register::L));
}

}  // namespace
}  // namespace gbcore::cpu
