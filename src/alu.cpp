#include "ls8/alu.hpp"

#include "ls8/errors.hpp"

namespace ls8 {

const char* aluOpName(AluOp op) {
    switch (op) {
    case AluOp::Add:
        return "ADD";
    case AluOp::Sub:
        return "SUB";
    case AluOp::Mul:
        return "MUL";
    case AluOp::Inc:
        return "INC";
    case AluOp::Dec:
        return "DEC";
    case AluOp::Cmp:
        return "CMP";
    }
    return "?";
}

const char* compareFlagName(CompareFlag flag) {
    switch (flag) {
    case CompareFlag::Equal:
        return "EQUAL";
    case CompareFlag::LessThan:
        return "LESS_THAN";
    case CompareFlag::GreaterThan:
        return "GREATER_THAN";
    }
    return "?";
}

Alu::Alu(RegisterFile& registers, std::optional<CompareFlag>& flag)
    : registers_(registers), flag_(flag) {}

void Alu::execute(AluOp op, std::uint8_t regA, std::uint8_t regB) {
    const long long lhs = registers_.get(regA);
    const long long rhs = registers_.get(regB);

    switch (op) {
    case AluOp::Add:
        registers_.set(regA, lhs + rhs);
        return;
    case AluOp::Sub:
        registers_.set(regA, lhs - rhs);
        return;
    case AluOp::Mul:
        registers_.set(regA, lhs * rhs);
        return;
    case AluOp::Inc:
        registers_.set(regA, lhs + 1);
        return;
    case AluOp::Dec:
        registers_.set(regA, lhs - 1);
        return;
    case AluOp::Cmp:
        if (lhs == rhs) {
            flag_ = CompareFlag::Equal;
        } else if (lhs < rhs) {
            flag_ = CompareFlag::LessThan;
        } else {
            flag_ = CompareFlag::GreaterThan;
        }
        return;
    }
    throw UnsupportedAluOperation(static_cast<int>(op));
}

} // namespace ls8
