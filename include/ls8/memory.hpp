#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ls8 {

class Memory {
public:
    static constexpr std::size_t kSize = 256;
    using Cells = std::array<std::uint8_t, kSize>;

    Memory();

    // Both accessors throw AddressOutOfRange outside [0, kSize). Addresses are
    // never wrapped here; the engine is responsible for producing valid ones.
    std::uint8_t read(std::size_t address) const;
    void write(std::size_t address, int value);

    void clear();

    std::size_t size() const { return kSize; }
    const Cells& cells() const { return cells_; }

private:
    Cells cells_;
};

} // namespace ls8
