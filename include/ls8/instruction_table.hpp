#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ls8 {

class ExecutionEngine;

// The two high bits of every LS-8 opcode hold its operand count, but the
// table declares the count explicitly rather than decoding it.
enum class OpCode : std::uint8_t {
    Hlt = 0b00000001,
    Ret = 0b00010001,
    Push = 0b01000101,
    Pop = 0b01000110,
    Prn = 0b01000111,
    Call = 0b01010000,
    Jmp = 0b01010100,
    Jeq = 0b01010101,
    Jne = 0b01010110,
    Inc = 0b01100101,
    Dec = 0b01100110,
    Ldi = 0b10000010,
    Add = 0b10100000,
    Sub = 0b10100001,
    Mul = 0b10100010,
    Cmp = 0b10100111
};

constexpr std::uint8_t toByte(OpCode op) {
    return static_cast<std::uint8_t>(op);
}

using InstructionHandler = void (*)(ExecutionEngine& engine, std::uint8_t operandA, std::uint8_t operandB);

struct InstructionInfo {
    std::uint8_t opcode{0};
    const char* mnemonic{nullptr};
    std::uint8_t operandCount{0};
    InstructionHandler handler{nullptr};
};

/**
 * Opcode -> handler lookup used by the engine's dispatch loop.
 * Lookup is a single array index; entries are registered once at startup.
 */
class InstructionTable {
public:
    InstructionTable();

    /**
     * Register an instruction.
     * Throws std::invalid_argument if the opcode is already registered, the
     * handler is null or the operand count exceeds 2.
     */
    void registerInstruction(OpCode op, const char* mnemonic, std::uint8_t operandCount, InstructionHandler handler);

    // Returns nullptr for opcodes nobody registered.
    const InstructionInfo* find(std::uint8_t opcode) const;

    // Throws InvalidOpcode, reporting pc, for unregistered opcodes.
    const InstructionInfo& lookup(std::uint8_t opcode, std::uint8_t pc) const;

    bool contains(std::uint8_t opcode) const;
    std::size_t size() const { return registered_; }

private:
    static constexpr std::size_t kOpcodeCount = 256;
    std::array<InstructionInfo, kOpcodeCount> entries_{};
    std::size_t registered_{0};
};

} // namespace ls8
