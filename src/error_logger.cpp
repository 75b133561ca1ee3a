#include "ls8/error_logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <typeinfo>

namespace ls8 {

namespace {

constexpr const char* kRule =
    "================================================================================\n";

std::string hexByte(std::uint8_t value) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(value);
    return oss.str();
}

} // namespace

std::string ErrorLogger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void ErrorLogger::writeRecord(const std::string& content) {
    std::ofstream ofs(logPath_, std::ios::app);
    if (ofs.is_open()) {
        ofs << content;
        ofs.flush();
    }
    if (echoToStderr_) {
        std::cerr << content;
    }
}

void ErrorLogger::logError(const std::string& errorMessage,
                           const std::string& functionName,
                           const std::string& fileName,
                           int lineNumber) {
    std::ostringstream oss;
    oss << "\n" << kRule;
    oss << "ERROR LOG - " << getTimestamp() << "\n";
    oss << kRule;
    oss << "Message: " << errorMessage << "\n";

    if (!functionName.empty()) {
        oss << "Function: " << functionName << "\n";
    }
    if (!fileName.empty()) {
        oss << "File: " << fileName << "\n";
    }
    if (lineNumber > 0) {
        oss << "Line: " << lineNumber << "\n";
    }

    if (!contextItems_.empty()) {
        oss << "\n--- Context ---\n";
        for (const auto& item : contextItems_) {
            oss << item.first << ": " << item.second << "\n";
        }
    }

    oss << kRule << "\n";

    writeRecord(oss.str());
    clearContext();
}

void ErrorLogger::logCpuError(const std::string& errorMessage,
                              std::uint8_t pc,
                              std::uint8_t opcode,
                              const std::array<std::uint8_t, 8>& registers,
                              const std::string& additionalContext) {
    std::ostringstream oss;
    oss << "\n" << kRule;
    oss << "CPU FAULT LOG - " << getTimestamp() << "\n";
    oss << kRule;
    oss << "Message: " << errorMessage << "\n";
    oss << "\n--- CPU State ---\n";
    oss << "PC: " << hexByte(pc) << "\n";
    oss << "Opcode: " << hexByte(opcode) << "\n";
    oss << "Registers:";
    for (std::size_t i = 0; i < registers.size(); ++i) {
        oss << " R" << i << '=' << hexByte(registers[i]);
    }
    oss << "\n";

    if (!additionalContext.empty()) {
        oss << "\n--- Additional Context ---\n";
        oss << additionalContext << "\n";
    }

    if (!contextItems_.empty()) {
        oss << "\n--- Debug Context ---\n";
        for (const auto& item : contextItems_) {
            oss << item.first << ": " << item.second << "\n";
        }
    }

    oss << kRule << "\n";

    writeRecord(oss.str());
    clearContext();
}

void ErrorLogger::logException(const std::exception& ex,
                               const std::string& context) {
    std::ostringstream oss;
    oss << "\n" << kRule;
    oss << "EXCEPTION LOG - " << getTimestamp() << "\n";
    oss << kRule;
    oss << "Exception Type: " << typeid(ex).name() << "\n";
    oss << "Message: " << ex.what() << "\n";

    if (!context.empty()) {
        oss << "Context: " << context << "\n";
    }

    if (!contextItems_.empty()) {
        oss << "\n--- Debug Context ---\n";
        for (const auto& item : contextItems_) {
            oss << item.first << ": " << item.second << "\n";
        }
    }

    oss << kRule << "\n";

    writeRecord(oss.str());
    clearContext();
}

void ErrorLogger::addContext(const std::string& key, const std::string& value) {
    contextItems_.emplace_back(key, value);
}

void ErrorLogger::clearContext() {
    contextItems_.clear();
}

void ErrorLogger::setLogPath(const std::string& path) {
    logPath_ = path;
}

} // namespace ls8
