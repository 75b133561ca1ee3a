#include "ls8/trace.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace {

TEST(TraceTest, FormatsPcFetchedBytesAndRegisters) {
    ls8::Memory memory;
    memory.write(0x10, 0x82);
    memory.write(0x11, 0x02);
    memory.write(0x12, 0xAB);
    ls8::RegisterFile registers;
    registers.set(0, 0x0F);
    registers.set(6, 0xC0);

    EXPECT_EQ(ls8::formatTrace(0x10, memory, registers),
              "TRACE: 10 | 82 02 AB | 0F 00 00 00 00 00 C0 F4");
}

TEST(TraceTest, FetchWrapsAtTopOfMemory) {
    ls8::Memory memory;
    memory.write(0xFF, 0x01);
    memory.write(0x00, 0x82);
    memory.write(0x01, 0x03);
    ls8::RegisterFile registers;

    std::ostringstream os;
    ls8::writeTrace(os, 0xFF, memory, registers);
    EXPECT_EQ(os.str(), "TRACE: FF | 01 82 03 | 00 00 00 00 00 00 00 F4\n");
}

} // namespace
