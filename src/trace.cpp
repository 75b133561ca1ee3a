#include "ls8/trace.hpp"

#include <iomanip>
#include <sstream>

namespace ls8 {

std::string formatTrace(std::uint8_t pc, const Memory& memory, const RegisterFile& registers) {
    const auto& cells = memory.cells();
    const auto byteAt = [&](unsigned offset) {
        return static_cast<int>(cells[(pc + offset) & 0xFF]);
    };

    std::ostringstream os;
    os << std::uppercase << std::hex << std::setfill('0');
    os << "TRACE: " << std::setw(2) << static_cast<int>(pc) << " |";
    for (unsigned offset = 0; offset < 3; ++offset) {
        os << ' ' << std::setw(2) << byteAt(offset);
    }
    os << " |";
    for (const auto value : registers.values()) {
        os << ' ' << std::setw(2) << static_cast<int>(value);
    }
    return os.str();
}

void writeTrace(std::ostream& os, std::uint8_t pc, const Memory& memory, const RegisterFile& registers) {
    os << formatTrace(pc, memory, registers) << '\n';
}

} // namespace ls8
