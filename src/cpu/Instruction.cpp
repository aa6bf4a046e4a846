#include "gbcore/cpu/Instruction.hpp"

#include <format>

namespace gbcore::cpu {
namespace {

std::string formatOperand(const Instruction& instruction, const Operand& operand) {
    switch (operand.kind) {
    case OperandKind::None:
        return {};
    case OperandKind::Register:
        return std::string(registerName(operand.reg));
    case OperandKind::Immediate8:
        return std::format("${:02X}", instruction.imm8());
    case OperandKind::Immediate16:
        return std::format("${:04X}", instruction.imm16());
    case OperandKind::RegisterIndirect:
        return std::format("({})", registerName(operand.reg));
    case OperandKind::RegisterIndirectDec:
        return std::format("({}-)", registerName(operand.reg));
    case OperandKind::RegisterIndirectInc:
        return std::format("({}+)", registerName(operand.reg));
    case OperandKind::AbsoluteIndirect:
        return std::format("(${:04X})", instruction.imm16());
    case OperandKind::HighImmediateIndirect:
        return std::format("($FF{:02X})", instruction.imm8());
    case OperandKind::HighRegisterIndirect:
        return std::format("($FF00+{})", registerName(operand.reg));
    case OperandKind::Relative: {
        const auto target = static_cast<uint16_t>(instruction.nextAddress() + instruction.relative());
        return std::format("${:04X}", target);
    }
    case OperandKind::SignedImmediate8: {
        const int offset = instruction.relative();
        return offset < 0 ? std::format("-${:02X}", -offset) : std::format("${:02X}", offset);
    }
    case OperandKind::StackRelative: {
        const int offset = instruction.relative();
        return offset < 0 ? std::format("SP-${:02X}", -offset) : std::format("SP+${:02X}", offset);
    }
    case OperandKind::BitIndex:
        return std::format("{}", operand.index);
    case OperandKind::Vector:
        return std::format("${:02X}", operand.index);
    }
    return "?";
}

}  // namespace

std::string_view mnemonicName(Mnemonic mnemonic) noexcept {
    switch (mnemonic) {
    case Mnemonic::Adc:
        return "ADC";
    case Mnemonic::Add:
        return "ADD";
    case Mnemonic::And:
        return "AND";
    case Mnemonic::Bit:
        return "BIT";
    case Mnemonic::Call:
        return "CALL";
    case Mnemonic::Ccf:
        return "CCF";
    case Mnemonic::Cp:
        return "CP";
    case Mnemonic::Cpl:
        return "CPL";
    case Mnemonic::Daa:
        return "DAA";
    case Mnemonic::Dec:
        return "DEC";
    case Mnemonic::Di:
        return "DI";
    case Mnemonic::Ei:
        return "EI";
    case Mnemonic::Halt:
        return "HALT";
    case Mnemonic::Inc:
        return "INC";
    case Mnemonic::Invalid:
        return "INVALID";
    case Mnemonic::Jp:
        return "JP";
    case Mnemonic::Jr:
        return "JR";
    case Mnemonic::Ld:
        return "LD";
    case Mnemonic::Ldh:
        return "LDH";
    case Mnemonic::Nop:
        return "NOP";
    case Mnemonic::Or:
        return "OR";
    case Mnemonic::Pop:
        return "POP";
    case Mnemonic::Prefix:
        return "PREFIX";
    case Mnemonic::Push:
        return "PUSH";
    case Mnemonic::Res:
        return "RES";
    case Mnemonic::Ret:
        return "RET";
    case Mnemonic::Reti:
        return "RETI";
    case Mnemonic::Rl:
        return "RL";
    case Mnemonic::Rla:
        return "RLA";
    case Mnemonic::Rlc:
        return "RLC";
    case Mnemonic::Rlca:
        return "RLCA";
    case Mnemonic::Rr:
        return "RR";
    case Mnemonic::Rra:
        return "RRA";
    case Mnemonic::Rrc:
        return "RRC";
    case Mnemonic::Rrca:
        return "RRCA";
    case Mnemonic::Rst:
        return "RST";
    case Mnemonic::Sbc:
        return "SBC";
    case Mnemonic::Scf:
        return "SCF";
    case Mnemonic::Set:
        return "SET";
    case Mnemonic::Sla:
        return "SLA";
    case Mnemonic::Sra:
        return "SRA";
    case Mnemonic::Srl:
        return "SRL";
    case Mnemonic::Stop:
        return "STOP";
    case Mnemonic::Sub:
        return "SUB";
    case Mnemonic::Swap:
        return "SWAP";
    case Mnemonic::Xor:
        return "XOR";
    }
    return "???";
}

std::string_view conditionName(Condition condition) noexcept {
    switch (condition) {
    case Condition::Always:
        return "";
    case Condition::NZ:
        return "NZ";
    case Condition::Z:
        return "Z";
    case Condition::NC:
        return "NC";
    case Condition::C:
        return "C";
    }
    return "";
}

std::string formatInstruction(const Instruction& instruction) {
    if (instruction.def == nullptr) {
        return "<none>";
    }

    std::string text(mnemonicName(instruction.mnemonic()));
    if (instruction.mnemonic() == Mnemonic::Invalid) {
        return std::format("{} ${:02X}", text, instruction.opcode());
    }

    std::string separator = " ";
    if (instruction.def->condition != Condition::Always) {
        text += separator;
        text += conditionName(instruction.def->condition);
        separator = ",";
    }
    for (const auto& operand : instruction.def->operands) {
        if (operand.isNone()) {
            continue;
        }
        text += separator;
        text += formatOperand(instruction, operand);
        separator = ",";
    }
    return text;
}

std::string formatInstructionBytes(const Instruction& instruction) {
    std::string text;
    for (uint8_t i = 0; i < instruction.length && i < instruction.bytes.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += std::format("{:02X}", instruction.bytes[i]);
    }
    return text;
}

}  // namespace gbcore::cpu
