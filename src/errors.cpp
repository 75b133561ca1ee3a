#include "ls8/errors.hpp"

#include <iomanip>
#include <sstream>

namespace ls8 {

namespace {

std::string hexByte(unsigned value) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(2) << value;
    return oss.str();
}

std::string binaryByte(std::uint8_t value) {
    std::string bits(8, '0');
    for (int i = 0; i < 8; ++i) {
        if (value & (0x80 >> i)) {
            bits[static_cast<std::size_t>(i)] = '1';
        }
    }
    return bits;
}

std::string invalidOpcodeMessage(std::uint8_t opcode, std::uint8_t pc) {
    return "Invalid opcode " + hexByte(opcode) + " (" + binaryByte(opcode) + ") at PC " + hexByte(pc);
}

std::string malformedLineMessage(const std::string& source, std::size_t lineNumber, const std::string& line) {
    std::ostringstream oss;
    oss << source << ':' << lineNumber << ": invalid binary literal: '" << line << "'";
    return oss.str();
}

} // namespace

InvalidOpcode::InvalidOpcode(std::uint8_t opcode, std::uint8_t pc)
    : Ls8Error(invalidOpcodeMessage(opcode, pc)), opcode_(opcode), pc_(pc) {}

UnsupportedAluOperation::UnsupportedAluOperation(int operation)
    : Ls8Error("Unsupported ALU operation " + std::to_string(operation)), operation_(operation) {}

AddressOutOfRange::AddressOutOfRange(std::size_t address)
    : Ls8Error("Memory address out of range: " + std::to_string(address)), address_(address) {}

ProgramFileNotFound::ProgramFileNotFound(const std::string& path)
    : Ls8Error("Could not find program file: " + path), path_(path) {}

MalformedProgramLine::MalformedProgramLine(const std::string& source,
                                           std::size_t lineNumber,
                                           const std::string& line,
                                           std::size_t column)
    : Ls8Error(malformedLineMessage(source, lineNumber, line)),
      source_(source),
      lineNumber_(lineNumber),
      line_(line),
      column_(column) {}

ProgramTooLarge::ProgramTooLarge(std::size_t byteCount)
    : Ls8Error("Program does not fit in memory: " + std::to_string(byteCount) + " bytes (limit 256)"),
      byteCount_(byteCount) {}

} // namespace ls8
