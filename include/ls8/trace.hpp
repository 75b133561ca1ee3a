#pragma once

#include "ls8/memory.hpp"
#include "ls8/register_file.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace ls8 {

// TRACE: PC | OP A B | R0 .. R7, all two-digit uppercase hex.
std::string formatTrace(std::uint8_t pc, const Memory& memory, const RegisterFile& registers);
void writeTrace(std::ostream& os, std::uint8_t pc, const Memory& memory, const RegisterFile& registers);

} // namespace ls8
