#include "ls8/register_file.hpp"

namespace ls8 {

RegisterFile::RegisterFile(std::uint8_t initialStackPointer) {
    reset(initialStackPointer);
}

std::uint8_t RegisterFile::get(std::size_t index) const {
    return values_[maskRegisterIndex(index)];
}

void RegisterFile::set(std::size_t index, long long value) {
    values_[maskRegisterIndex(index)] = maskByte(value);
}

void RegisterFile::reset(std::uint8_t initialStackPointer) {
    values_.fill(0);
    values_[kStackPointerRegister] = initialStackPointer;
}

} // namespace ls8
