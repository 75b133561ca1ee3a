#include "ls8/instruction_table.hpp"

#include "ls8/errors.hpp"

#include <stdexcept>
#include <string>

namespace ls8 {

InstructionTable::InstructionTable() = default;

void InstructionTable::registerInstruction(OpCode op,
                                           const char* mnemonic,
                                           std::uint8_t operandCount,
                                           InstructionHandler handler) {
    const std::uint8_t opcode = toByte(op);
    if (!handler) {
        throw std::invalid_argument("Null handler for opcode " + std::to_string(opcode));
    }
    if (operandCount > 2) {
        throw std::invalid_argument("Operand count above 2 for opcode " + std::to_string(opcode));
    }
    if (entries_[opcode].handler) {
        throw std::invalid_argument("Opcode already registered: " + std::to_string(opcode));
    }
    entries_[opcode] = InstructionInfo{opcode, mnemonic, operandCount, handler};
    ++registered_;
}

const InstructionInfo* InstructionTable::find(std::uint8_t opcode) const {
    const auto& entry = entries_[opcode];
    return entry.handler ? &entry : nullptr;
}

const InstructionInfo& InstructionTable::lookup(std::uint8_t opcode, std::uint8_t pc) const {
    const InstructionInfo* info = find(opcode);
    if (!info) {
        throw InvalidOpcode(opcode, pc);
    }
    return *info;
}

bool InstructionTable::contains(std::uint8_t opcode) const {
    return find(opcode) != nullptr;
}

} // namespace ls8
