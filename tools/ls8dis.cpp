#include "ls8/disassembler.hpp"
#include "ls8/engine.hpp"
#include "ls8/errors.hpp"
#include "ls8/program_loader.hpp"

#include <iostream>

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: ls8dis <program.ls8>\n";
        return 1;
    }

    try {
        const auto program = ls8::loadProgramFile(argv[1]);
        const auto lines = ls8::disassemble(program, ls8::ExecutionEngine::instructionTable());
        std::cout << ls8::formatDisassembly(lines);
    } catch (const ls8::Ls8Error& ex) {
        std::cerr << "Disassembly failed: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
