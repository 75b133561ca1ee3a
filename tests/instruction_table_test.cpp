#include "ls8/engine.hpp"
#include "ls8/errors.hpp"
#include "ls8/instruction_table.hpp"

#include <gtest/gtest.h>

#include <iterator>
#include <stdexcept>
#include <string>

namespace {

void noop(ls8::ExecutionEngine&, std::uint8_t, std::uint8_t) {}

TEST(InstructionTableTest, RegisterAndFind) {
    ls8::InstructionTable table;
    EXPECT_EQ(table.size(), 0u);
    table.registerInstruction(ls8::OpCode::Ldi, "LDI", 2, &noop);

    const ls8::InstructionInfo* info = table.find(0b10000010);
    ASSERT_NE(info, nullptr);
    EXPECT_STREQ(info->mnemonic, "LDI");
    EXPECT_EQ(info->operandCount, 2);
    EXPECT_TRUE(table.contains(0b10000010));
    EXPECT_FALSE(table.contains(0b10000011));
    EXPECT_EQ(table.find(0), nullptr);
}

TEST(InstructionTableTest, RejectsBadRegistrations) {
    ls8::InstructionTable table;
    table.registerInstruction(ls8::OpCode::Hlt, "HLT", 0, &noop);
    EXPECT_THROW(table.registerInstruction(ls8::OpCode::Hlt, "HLT", 0, &noop), std::invalid_argument);
    EXPECT_THROW(table.registerInstruction(ls8::OpCode::Ret, "RET", 3, &noop), std::invalid_argument);
    EXPECT_THROW(table.registerInstruction(ls8::OpCode::Jmp, "JMP", 1, nullptr), std::invalid_argument);
}

TEST(InstructionTableTest, LookupOfUnknownOpcodeThrowsInvalidOpcode) {
    ls8::InstructionTable table;
    try {
        table.lookup(0xFF, 0x12);
        FAIL() << "expected InvalidOpcode";
    } catch (const ls8::InvalidOpcode& e) {
        EXPECT_EQ(e.opcode(), 0xFF);
        EXPECT_EQ(e.pc(), 0x12);
        EXPECT_NE(std::string(e.what()).find("0xFF"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("0x12"), std::string::npos);
    }
}

struct ExpectedInstruction {
    std::uint8_t opcode;
    const char* mnemonic;
    std::uint8_t operandCount;
};

TEST(InstructionTableTest, EngineTableCoversTheInstructionSet) {
    const ExpectedInstruction expected[] = {
        {0b00000001, "HLT", 0}, {0b10000010, "LDI", 2}, {0b01000111, "PRN", 1},
        {0b10100000, "ADD", 2}, {0b10100001, "SUB", 2}, {0b10100010, "MUL", 2},
        {0b01100101, "INC", 1}, {0b01100110, "DEC", 1}, {0b01000101, "PUSH", 1},
        {0b01000110, "POP", 1}, {0b01010000, "CALL", 1}, {0b00010001, "RET", 0},
        {0b10100111, "CMP", 2}, {0b01010100, "JMP", 1}, {0b01010101, "JEQ", 1},
        {0b01010110, "JNE", 1},
    };

    const auto& table = ls8::ExecutionEngine::instructionTable();
    EXPECT_EQ(table.size(), std::size(expected));
    for (const auto& entry : expected) {
        const ls8::InstructionInfo* info = table.find(entry.opcode);
        ASSERT_NE(info, nullptr) << entry.mnemonic;
        EXPECT_STREQ(info->mnemonic, entry.mnemonic);
        EXPECT_EQ(info->operandCount, entry.operandCount) << entry.mnemonic;
        // LS-8 encodes the operand count in the top two opcode bits.
        EXPECT_EQ(entry.opcode >> 6, entry.operandCount) << entry.mnemonic;
    }
}

} // namespace
