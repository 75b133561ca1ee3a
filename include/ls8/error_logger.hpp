#pragma once

#include <array>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace ls8 {

/**
 * ErrorLogger - Appends fault reports to ls8_error.log and echoes them to
 * stderr, so a failed run leaves the machine state behind for inspection.
 */
class ErrorLogger {
public:
    static ErrorLogger& instance() {
        static ErrorLogger inst;
        return inst;
    }

    // Log an error with source location context
    void logError(const std::string& errorMessage,
                  const std::string& functionName = "",
                  const std::string& fileName = "",
                  int lineNumber = 0);

    // Log an engine fault together with the machine state at the fault
    void logCpuError(const std::string& errorMessage,
                     std::uint8_t pc,
                     std::uint8_t opcode,
                     const std::array<std::uint8_t, 8>& registers,
                     const std::string& additionalContext = "");

    void logException(const std::exception& ex,
                      const std::string& context = "");

    // Key/value pairs appended to the next record, then cleared
    void addContext(const std::string& key, const std::string& value);
    void clearContext();

    void setLogPath(const std::string& path);
    const std::string& logPath() const { return logPath_; }

    // stderr echo; on by default
    void setEchoToStderr(bool echo) { echoToStderr_ = echo; }

private:
    ErrorLogger() = default;
    ~ErrorLogger() = default;

    std::string getTimestamp() const;
    void writeRecord(const std::string& content);

    std::string logPath_ = "ls8_error.log";
    bool echoToStderr_ = true;
    std::vector<std::pair<std::string, std::string>> contextItems_;
};

#define LS8_LOG_ERROR(msg) \
    ls8::ErrorLogger::instance().logError(msg, __FUNCTION__, __FILE__, __LINE__)

#define LS8_LOG_EXCEPTION(ex) \
    ls8::ErrorLogger::instance().logException(ex, std::string(__FUNCTION__) + " at " + __FILE__ + ":" + std::to_string(__LINE__))

} // namespace ls8
