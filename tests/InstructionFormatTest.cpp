#include "gbcore/bus/FlatBus.hpp"
#include "gbcore/cpu/Decoder.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace gbcore::cpu {
namespace {

Instruction decodeAt(uint16_t address, std::initializer_list<uint8_t> bytes) {
    bus::FlatBus memory;
    const std::vector<uint8_t> data(bytes);
    memory.load(address, data);
    const auto instruction = decodeInstruction(memory, address);
    EXPECT_TRUE(instruction.has_value());
    return instruction.value_or(Instruction{});
}

std::string format(std::initializer_list<uint8_t> bytes, uint16_t address = 0) {
    return formatInstruction(decodeAt(address, bytes));
}

TEST(InstructionFormatTest, Loads) {
    EXPECT_EQ(format({0x31, 0xFE, 0xFF}), "LD SP,$FFFE");
    EXPECT_EQ(format({0x78}), "LD A,B");
    EXPECT_EQ(format({0x36, 0x7F}), "LD (HL),$7F");
    EXPECT_EQ(format({0x32}), "LD (HL-),A");
    EXPECT_EQ(format({0x2A}), "LD A,(HL+)");
    EXPECT_EQ(format({0x1A}), "LD A,(DE)");
    EXPECT_EQ(format({0xEA, 0x00, 0xC0}), "LD ($C000),A");
    EXPECT_EQ(format({0x08, 0x10, 0xD0}), "LD ($D010),SP");
    EXPECT_EQ(format({0xE0, 0x44}), "LDH ($FF44),A");
    EXPECT_EQ(format({0xF0, 0x0F}), "LDH A,($FF0F)");
    EXPECT_EQ(format({0xE2}), "LD ($FF00+C),A");
    EXPECT_EQ(format({0xF8, 0x05}), "LD HL,SP+$05");
    EXPECT_EQ(format({0xF8, 0xFB}), "LD HL,SP-$05");
}

TEST(InstructionFormatTest, Arithmetic) {
    EXPECT_EQ(format({0x80}), "ADD A,B");
    EXPECT_EQ(format({0xCE, 0x01}), "ADC A,$01");
    EXPECT_EQ(format({0x96}), "SUB (HL)");
    EXPECT_EQ(format({0xFE, 0x90}), "CP $90");
    EXPECT_EQ(format({0xA8}), "XOR B");
    EXPECT_EQ(format({0x09}), "ADD HL,BC");
    EXPECT_EQ(format({0xE8, 0xFE}), "ADD SP,-$02");
    EXPECT_EQ(format({0x34}), "INC (HL)");
    EXPECT_EQ(format({0x27}), "DAA");
}

TEST(InstructionFormatTest, ControlFlow) {
    EXPECT_EQ(format({0x20, 0x05}), "JR NZ,$0007");
    EXPECT_EQ(format({0x18, 0xFE}, 0x0150), "JR $0150");
    EXPECT_EQ(format({0xC3, 0x50, 0x01}), "JP $0150");
    EXPECT_EQ(format({0xE9}), "JP HL");
    EXPECT_EQ(format({0xDC, 0x00, 0x40}), "CALL C,$4000");
    EXPECT_EQ(format({0xC0}), "RET NZ");
    EXPECT_EQ(format({0xFF}), "RST $38");
    EXPECT_EQ(format({0xD9}), "RETI");
    EXPECT_EQ(format({0x10, 0x00}), "STOP $00");
}

TEST(InstructionFormatTest, ExtendedAndReserved) {
    EXPECT_EQ(format({0xCB, 0x7C}), "BIT 7,H");
    EXPECT_EQ(format({0xCB, 0x46}), "BIT 0,(HL)");
    EXPECT_EQ(format({0xCB, 0x37}), "SWAP A");
    EXPECT_EQ(format({0xCB, 0xDE}), "SET 3,(HL)");
    EXPECT_EQ(format({0xD3}), "INVALID $D3");
}

TEST(InstructionFormatTest, RawBytes) {
    EXPECT_EQ(formatInstructionBytes(decodeAt(0, {0x31, 0xFE, 0xFF})), "31 FE FF");
    EXPECT_EQ(formatInstructionBytes(decodeAt(0, {0xCB, 0x11})), "CB 11");
    EXPECT_EQ(formatInstructionBytes(decodeAt(0, {0x00, 0xAA})), "00");
}

TEST(InstructionFormatTest, MnemonicAndConditionNames) {
    EXPECT_EQ(mnemonicName(Mnemonic::Ldh), "LDH");
    EXPECT_EQ(mnemonicName(Mnemonic::Reti), "RETI");
    EXPECT_EQ(conditionName(Condition::NC), "NC");
    EXPECT_EQ(conditionName(Condition::Always), "");
    EXPECT_EQ(formatInstruction(Instruction{}), "<none>");
}

}  // namespace
}  // namespace gbcore::cpu
