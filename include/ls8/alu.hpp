#pragma once

#include "ls8/register_file.hpp"

#include <cstdint>
#include <optional>

namespace ls8 {

enum class AluOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Inc,
    Dec,
    Cmp
};

enum class CompareFlag : std::uint8_t {
    Equal,
    LessThan,
    GreaterThan
};

const char* aluOpName(AluOp op);
const char* compareFlagName(CompareFlag flag);

// Register-to-register arithmetic. Every result is masked to 8 bits before it
// is stored; CMP only touches the flag.
class Alu {
public:
    Alu(RegisterFile& registers, std::optional<CompareFlag>& flag);

    void execute(AluOp op, std::uint8_t regA, std::uint8_t regB = 0);

private:
    RegisterFile& registers_;
    std::optional<CompareFlag>& flag_;
};

} // namespace ls8
