#pragma once

#include "ls8/instruction_table.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ls8 {

struct DisassembledLine {
    std::size_t address{0};
    std::size_t length{1};
    std::string text;
};

std::vector<DisassembledLine> disassemble(const std::vector<std::uint8_t>& program, const InstructionTable& table);
std::string formatDisassembly(const std::vector<DisassembledLine>& lines);

} // namespace ls8
