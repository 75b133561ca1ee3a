#include "ls8/memory.hpp"

#include "ls8/errors.hpp"
#include "ls8/register_file.hpp"

namespace ls8 {

Memory::Memory() {
    clear();
}

std::uint8_t Memory::read(std::size_t address) const {
    if (address >= kSize) {
        throw AddressOutOfRange(address);
    }
    return cells_[address];
}

void Memory::write(std::size_t address, int value) {
    if (address >= kSize) {
        throw AddressOutOfRange(address);
    }
    cells_[address] = maskByte(value);
}

void Memory::clear() {
    cells_.fill(0);
}

} // namespace ls8
