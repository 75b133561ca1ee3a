#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace ls8 {

class ExecutionEngine;

// Parses LS-8 program text: one binary literal per line, '#' starts a
// comment, blank lines are skipped. `source` only labels diagnostics.
std::vector<std::uint8_t> parseProgram(std::istream& input, const std::string& source = "<input>");
std::vector<std::uint8_t> parseProgramText(const std::string& text, const std::string& source = "<input>");

// Returns the first existing candidate: `path` itself, then `path` under each
// search directory. Empty when nothing exists.
std::string resolveProgramPath(const std::string& path, const std::vector<std::string>& searchPaths = {});

std::vector<std::uint8_t> loadProgramFile(const std::string& path, const std::vector<std::string>& searchPaths = {});
void loadProgramFile(ExecutionEngine& engine, const std::string& path, const std::vector<std::string>& searchPaths = {});

} // namespace ls8
