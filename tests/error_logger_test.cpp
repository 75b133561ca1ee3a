#include "ls8/error_logger.hpp"
#include "ls8/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {

namespace fs = std::filesystem;

class ErrorLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = ls8::ErrorLogger::instance();
        previousPath_ = logger.logPath();
        logPath_ = fs::temp_directory_path() /
                   ("ls8_error_logger_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".log");
        fs::remove(logPath_);
        logger.setLogPath(logPath_.string());
        logger.setEchoToStderr(false);
    }

    void TearDown() override {
        auto& logger = ls8::ErrorLogger::instance();
        logger.setLogPath(previousPath_);
        logger.setEchoToStderr(true);
        logger.clearContext();
        std::error_code ec;
        fs::remove(logPath_, ec);
    }

    std::string readLog() const {
        std::ifstream in(logPath_);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    fs::path logPath_;
    std::string previousPath_;
};

TEST_F(ErrorLoggerTest, CpuFaultRecordsMachineState) {
    std::array<std::uint8_t, 8> registers{0x11, 0, 0, 0, 0, 0, 0, 0xF4};
    ls8::ErrorLogger::instance().addContext("Program", "demo.ls8");
    ls8::ErrorLogger::instance().logCpuError("Invalid opcode", 0x03, 0xFF, registers);

    const std::string log = readLog();
    EXPECT_NE(log.find("CPU FAULT LOG"), std::string::npos);
    EXPECT_NE(log.find("Message: Invalid opcode"), std::string::npos);
    EXPECT_NE(log.find("PC: 0x03"), std::string::npos);
    EXPECT_NE(log.find("Opcode: 0xFF"), std::string::npos);
    EXPECT_NE(log.find("R0=0x11"), std::string::npos);
    EXPECT_NE(log.find("R7=0xF4"), std::string::npos);
    EXPECT_NE(log.find("Program: demo.ls8"), std::string::npos);
}

TEST_F(ErrorLoggerTest, ContextIsClearedAfterEachRecord) {
    auto& logger = ls8::ErrorLogger::instance();
    logger.addContext("Key", "first");
    LS8_LOG_ERROR("one");
    LS8_LOG_ERROR("two");

    const std::string log = readLog();
    const auto firstKey = log.find("Key: first");
    ASSERT_NE(firstKey, std::string::npos);
    EXPECT_EQ(log.find("Key: first", firstKey + 1), std::string::npos);
    EXPECT_NE(log.find("Message: two"), std::string::npos);
}

TEST_F(ErrorLoggerTest, ExceptionsAreLoggedWithTheirMessage) {
    const ls8::AddressOutOfRange error(300);
    LS8_LOG_EXCEPTION(error);

    const std::string log = readLog();
    EXPECT_NE(log.find("EXCEPTION LOG"), std::string::npos);
    EXPECT_NE(log.find("Memory address out of range: 300"), std::string::npos);
}

} // namespace
