#include "ls8/program_loader.hpp"

#include "ls8/engine.hpp"
#include "ls8/errors.hpp"
#include "ls8/memory.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace ls8 {

namespace {

constexpr std::size_t kMaxLiteralDigits = 8;

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Offset of the first character that keeps `literal` from being a binary
// byte, or npos when it is valid.
std::size_t findInvalidDigit(const std::string& literal) {
    for (std::size_t i = 0; i < literal.size(); ++i) {
        if (literal[i] != '0' && literal[i] != '1') {
            return i;
        }
        if (i >= kMaxLiteralDigits) {
            return i;
        }
    }
    return std::string::npos;
}

std::uint8_t parseBinary(const std::string& literal) {
    unsigned value = 0;
    for (char c : literal) {
        value = (value << 1) | static_cast<unsigned>(c - '0');
    }
    return static_cast<std::uint8_t>(value);
}

} // namespace

std::vector<std::uint8_t> parseProgram(std::istream& input, const std::string& source) {
    std::vector<std::uint8_t> program;
    std::string rawLine;
    std::size_t lineNumber = 0;

    while (std::getline(input, rawLine)) {
        ++lineNumber;
        const std::size_t commentPos = rawLine.find('#');
        const std::size_t codeEnd = commentPos == std::string::npos ? rawLine.size() : commentPos;

        std::size_t begin = 0;
        while (begin < codeEnd && isSpace(rawLine[begin])) {
            ++begin;
        }
        std::size_t end = codeEnd;
        while (end > begin && isSpace(rawLine[end - 1])) {
            --end;
        }
        if (begin == end) {
            continue;
        }

        const std::string literal = rawLine.substr(begin, end - begin);
        const std::size_t bad = findInvalidDigit(literal);
        if (bad != std::string::npos) {
            throw MalformedProgramLine(source, lineNumber, rawLine, begin + bad + 1);
        }
        if (program.size() == Memory::kSize) {
            throw ProgramTooLarge(program.size() + 1);
        }
        program.push_back(parseBinary(literal));
    }
    return program;
}

std::vector<std::uint8_t> parseProgramText(const std::string& text, const std::string& source) {
    std::istringstream input(text);
    return parseProgram(input, source);
}

std::string resolveProgramPath(const std::string& path, const std::vector<std::string>& searchPaths) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path input(path);
    if (fs::is_regular_file(input, ec)) {
        return input.string();
    }
    if (input.is_absolute()) {
        return {};
    }

    for (const auto& base : searchPaths) {
        if (base.empty()) {
            continue;
        }
        fs::path candidate = fs::path(base) / input;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }

    return {};
}

std::vector<std::uint8_t> loadProgramFile(const std::string& path, const std::vector<std::string>& searchPaths) {
    const auto resolvedPath = resolveProgramPath(path, searchPaths);
    if (resolvedPath.empty()) {
        throw ProgramFileNotFound(path);
    }

    std::ifstream input(resolvedPath);
    if (!input) {
        throw ProgramFileNotFound(resolvedPath);
    }
    return parseProgram(input, resolvedPath);
}

void loadProgramFile(ExecutionEngine& engine, const std::string& path, const std::vector<std::string>& searchPaths) {
    engine.load(loadProgramFile(path, searchPaths));
}

} // namespace ls8
