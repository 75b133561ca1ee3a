#include "ls8/disassembler.hpp"
#include "ls8/engine.hpp"

#include <gtest/gtest.h>

namespace {

TEST(DisassemblerTest, DecodesInstructionsWithOperands) {
    const std::vector<std::uint8_t> program = {
        0x82, 0x00, 0x08,  // LDI R0, 8
        0xA0, 0x00, 0x01,  // ADD R0, R1
        0x47, 0x00,        // PRN R0
        0x11,              // RET
        0x01,              // HLT
    };
    const auto lines = ls8::disassemble(program, ls8::ExecutionEngine::instructionTable());

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0].text, "LDI R0, 8");
    EXPECT_EQ(lines[1].address, 3u);
    EXPECT_EQ(lines[1].text, "ADD R0, R1");
    EXPECT_EQ(lines[2].text, "PRN R0");
    EXPECT_EQ(lines[3].text, "RET");
    EXPECT_EQ(lines[4].address, 9u);
    EXPECT_EQ(lines[4].text, "HLT");
}

TEST(DisassemblerTest, UnknownAndTruncatedBytes) {
    const std::vector<std::uint8_t> program = {0xFF, 0x82, 0x00};
    const auto lines = ls8::disassemble(program, ls8::ExecutionEngine::instructionTable());

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, ".byte 0xFF");
    EXPECT_EQ(lines[1].text, ".byte 0x82");
    EXPECT_EQ(lines[2].text, ".byte 0x00");
}

TEST(DisassemblerTest, FormatsOneLinePerInstruction) {
    const std::vector<std::uint8_t> program = {0x82, 0x09, 0xFF, 0x01};
    const auto text = ls8::formatDisassembly(
        ls8::disassemble(program, ls8::ExecutionEngine::instructionTable()));
    EXPECT_EQ(text, "00: LDI R1, 255\n03: HLT\n");
}

} // namespace
