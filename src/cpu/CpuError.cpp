#include "gbcore/cpu/CpuError.hpp"

namespace gbcore::cpu {

std::string_view cpuErrorToString(CpuError error) noexcept {
    switch (error) {
    case CpuError::UnexpectedEndOfData:
        return "Instruction runs past the end of the address space";
    case CpuError::InvalidOpcode:
        return "Invalid opcode";
    case CpuError::UnsupportedOperand:
        return "Unsupported operand for instruction";
    }
    return "Unknown CPU error";
}

}  // namespace gbcore::cpu
