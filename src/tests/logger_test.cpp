#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace gridstore::logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = std::filesystem::temp_directory_path() / "gridstore_logger_test.log";
        std::filesystem::remove(log_path);

        init_logging(log_path.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
        std::filesystem::remove(log_path);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();

        std::ifstream file(log_path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }

    std::filesystem::path log_path;
};

TEST_F(LoggerTest, BasicLogging) {
    LOG_INFO << "Test info message";
    LOG_ERROR << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_log_level(boost::log::trivial::warning);

    LOG_DEBUG << "Filtered debug message";
    LOG_INFO << "Filtered info message";
    LOG_WARN << "Visible warning message";

    EXPECT_FALSE(log_contains("Filtered debug message"));
    EXPECT_FALSE(log_contains("Filtered info message"));
    EXPECT_TRUE(log_contains("Visible warning message"));
}

TEST_F(LoggerTest, DisableAndEnable) {
    disable_logging();
    LOG_ERROR << "Dropped while disabled";
    enable_logging();
    LOG_ERROR << "Written after enable";

    EXPECT_FALSE(log_contains("Dropped while disabled"));
    EXPECT_TRUE(log_contains("Written after enable"));
}

TEST_F(LoggerTest, ParseSeverity) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}
