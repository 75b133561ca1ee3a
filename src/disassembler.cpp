#include "ls8/disassembler.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace ls8 {

namespace {

std::string hex2(unsigned value) {
    std::ostringstream os;
    os << std::uppercase << std::hex << std::setfill('0') << std::setw(2) << value;
    return os.str();
}

} // namespace

std::vector<DisassembledLine> disassemble(const std::vector<std::uint8_t>& program, const InstructionTable& table) {
    std::vector<DisassembledLine> lines;
    std::size_t address = 0;
    while (address < program.size()) {
        const std::uint8_t opcode = program[address];
        const InstructionInfo* info = table.find(opcode);

        DisassembledLine line;
        line.address = address;
        if (!info || address + info->operandCount >= program.size()) {
            line.text = ".byte 0x" + hex2(opcode);
            line.length = 1;
        } else {
            std::ostringstream os;
            os << info->mnemonic;
            for (std::uint8_t i = 0; i < info->operandCount; ++i) {
                const unsigned operand = program[address + 1 + i];
                os << (i == 0 ? " " : ", ");
                // LDI's second operand is an immediate, everything else names a register.
                if (opcode == toByte(OpCode::Ldi) && i == 1) {
                    os << operand;
                } else {
                    os << 'R' << (operand & 0x07);
                }
            }
            line.text = os.str();
            line.length = 1u + info->operandCount;
        }
        address += line.length;
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string formatDisassembly(const std::vector<DisassembledLine>& lines) {
    std::ostringstream os;
    for (const auto& line : lines) {
        os << hex2(static_cast<unsigned>(line.address)) << ": " << line.text << '\n';
    }
    return os.str();
}

} // namespace ls8
