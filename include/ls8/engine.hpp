#pragma once

#include "ls8/alu.hpp"
#include "ls8/instruction_table.hpp"
#include "ls8/memory.hpp"
#include "ls8/register_file.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace ls8 {

enum class RunState : std::uint8_t {
    Running,
    Halted
};

struct EngineConfig {
    std::uint8_t initialStackPointer{kInitialStackPointer};
    // PRN destination; std::cout when null.
    std::ostream* output{nullptr};
    // When set, one trace line is written before every instruction.
    std::ostream* trace{nullptr};
};

class ExecutionEngine {
public:
    explicit ExecutionEngine(EngineConfig config = {});

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Copies the image to address 0 and resets PC, registers, flag and state.
    // Throws ProgramTooLarge for images over Memory::kSize bytes.
    void load(const std::vector<std::uint8_t>& program);

    // Executes one instruction. Returns whether the engine is still running.
    // A fault halts the engine before the exception leaves step().
    bool step();
    void runToHalt();

    std::uint8_t pc() const { return pc_; }
    RunState state() const { return state_; }
    bool isRunning() const { return state_ == RunState::Running; }
    std::optional<CompareFlag> flag() const { return flag_; }
    std::uint64_t instructionCount() const { return instructionCount_; }

    const Memory& memory() const { return memory_; }
    const RegisterFile& registers() const { return registers_; }

    void setTraceStream(std::ostream* trace) { config_.trace = trace; }

    static const InstructionTable& instructionTable();

private:
    struct Handlers;

    void execute();
    void jumpTo(std::uint8_t address);
    void pushByte(std::uint8_t value);
    std::uint8_t popByte();
    std::ostream& output() const;

    EngineConfig config_;
    Memory memory_;
    RegisterFile registers_;
    std::optional<CompareFlag> flag_;
    Alu alu_;
    std::uint8_t pc_{0};
    RunState state_{RunState::Running};
    bool pcWritten_{false};
    std::uint64_t instructionCount_{0};
};

} // namespace ls8
