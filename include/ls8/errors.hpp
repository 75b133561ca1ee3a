#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ls8 {

// Base for every failure the simulator reports. Nothing here is recoverable
// mid-run: the engine halts and the error propagates to the caller.
class Ls8Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidOpcode : public Ls8Error {
public:
    InvalidOpcode(std::uint8_t opcode, std::uint8_t pc);

    std::uint8_t opcode() const { return opcode_; }
    std::uint8_t pc() const { return pc_; }

private:
    std::uint8_t opcode_;
    std::uint8_t pc_;
};

class UnsupportedAluOperation : public Ls8Error {
public:
    explicit UnsupportedAluOperation(int operation);

    int operation() const { return operation_; }

private:
    int operation_;
};

class AddressOutOfRange : public Ls8Error {
public:
    explicit AddressOutOfRange(std::size_t address);

    std::size_t address() const { return address_; }

private:
    std::size_t address_;
};

class ProgramFileNotFound : public Ls8Error {
public:
    explicit ProgramFileNotFound(const std::string& path);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * A program line that is not a binary literal of 1 to 8 digits.
 * Carries the raw line and the 1-based column of the first offending
 * character so front ends can point at it.
 */
class MalformedProgramLine : public Ls8Error {
public:
    MalformedProgramLine(const std::string& source,
                         std::size_t lineNumber,
                         const std::string& line,
                         std::size_t column);

    const std::string& source() const { return source_; }
    std::size_t lineNumber() const { return lineNumber_; }
    const std::string& line() const { return line_; }
    std::size_t column() const { return column_; }

private:
    std::string source_;
    std::size_t lineNumber_;
    std::string line_;
    std::size_t column_;
};

class ProgramTooLarge : public Ls8Error {
public:
    explicit ProgramTooLarge(std::size_t byteCount);

    std::size_t byteCount() const { return byteCount_; }

private:
    std::size_t byteCount_;
};

} // namespace ls8
