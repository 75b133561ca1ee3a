#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ls8 {

constexpr std::size_t kRegisterCount = 8;
constexpr std::uint8_t kStackPointerRegister = 7;
constexpr std::uint8_t kInitialStackPointer = 0xF4;

// Instruction operands are raw bytes. These are the only places they are
// turned into register indices and register values: indices wrap onto R0-R7
// and values wrap modulo 256. Neither is treated as an error.
constexpr std::uint8_t maskRegisterIndex(std::size_t index) {
    return static_cast<std::uint8_t>(index & 0x07);
}

constexpr std::uint8_t maskByte(long long value) {
    return static_cast<std::uint8_t>(value & 0xFF);
}

class RegisterFile {
public:
    using Values = std::array<std::uint8_t, kRegisterCount>;

    explicit RegisterFile(std::uint8_t initialStackPointer = kInitialStackPointer);

    std::uint8_t get(std::size_t index) const;
    void set(std::size_t index, long long value);

    std::uint8_t sp() const { return get(kStackPointerRegister); }
    void setSp(long long value) { set(kStackPointerRegister, value); }

    void reset(std::uint8_t initialStackPointer = kInitialStackPointer);

    const Values& values() const { return values_; }

private:
    Values values_{};
};

} // namespace ls8
