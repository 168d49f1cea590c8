#include <gtest/gtest.h>
#include <sstream>
#include "Logger.h"
#include "ProgressCounter.h"

class LoggerTest : public ::testing::Test {
protected:
    std::ostringstream out;

    void SetUp() override {
        logger::Loggers::add(std::make_shared<logger::Logger>("test", out, logger::LogLevel::Info));
    }

    void TearDown() override {
        logger::Loggers::remove("test");
    }
};

TEST_F(LoggerTest, LevelFilter) {
    LOG_DEBUG("hidden");
    LOG_INFO("shown");
    LOG_WARNING("warned");

    auto text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("info: shown"), std::string::npos) << text;
    EXPECT_NE(text.find("WARNING: warned"), std::string::npos) << text;
    EXPECT_NE(text.find("test_logger.cpp"), std::string::npos) << text;
}

TEST_F(LoggerTest, SetMinLevel) {
    logger::Loggers::get("test")->setMinLevel(logger::LogLevel::Error);
    LOG_WARNING("dropped");
    LOG_ERROR("kept");
    EXPECT_EQ(out.str().find("dropped"), std::string::npos);
    EXPECT_NE(out.str().find("kept"), std::string::npos);
}

TEST_F(LoggerTest, Registry) {
    EXPECT_FALSE(logger::Loggers::add(std::make_shared<logger::Logger>("test", std::cerr, logger::LogLevel::Info)));
    EXPECT_NE(logger::Loggers::get("test"), nullptr);
    EXPECT_EQ(logger::Loggers::get("missing"), nullptr);
    EXPECT_FALSE(logger::Loggers::remove("missing"));
}

TEST_F(LoggerTest, ProgressCounter) {
    auto counter = ProgressCounter("Loop", 4, 50.0, logger::LogLevel::Info);
    EXPECT_FALSE(counter.increment());
    EXPECT_TRUE(counter.increment());
    EXPECT_FALSE(counter.increment());
    EXPECT_TRUE(counter.increment());
    EXPECT_NE(out.str().find("Loop: 100.0% finished"), std::string::npos) << out.str();

    auto empty = ProgressCounter("Empty", 0);
    EXPECT_FALSE(empty.increment());
}

TEST(LogLevelTest, ByName) {
    EXPECT_EQ(logger::logLevelOf("debug"), logger::LogLevel::Debug);
    EXPECT_EQ(logger::logLevelOf("WARNING"), logger::LogLevel::Warning);
    EXPECT_EQ(logger::logLevelOf("Critical"), logger::LogLevel::Critical);
    EXPECT_THROW((void)logger::logLevelOf("verbose"), std::invalid_argument);
    EXPECT_LT(logger::LogLevel::Info, logger::LogLevel::Error);
}
