#include "logger.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger::set_console(false);
        logger::set_level(logger::Level::Info);
        logger::clear();
    }

    void TearDown() override {
        logger::set_log_file("");
        logger::set_level(logger::Level::Info);
        logger::set_console(true);
        logger::clear();
    }
};

TEST(LoggerLevelTest, FromString) {
    EXPECT_EQ(logger::level_from_string("info"), logger::Level::Info);
    EXPECT_EQ(logger::level_from_string("WARN"), logger::Level::Warn);
    EXPECT_EQ(logger::level_from_string("warning"), logger::Level::Warn);
    EXPECT_EQ(logger::level_from_string("Error"), logger::Level::Error);
    EXPECT_EQ(logger::level_from_string("verbose"), logger::Level::Info);
    EXPECT_STREQ(logger::to_string(logger::Level::Warn), "WARN");
}

TEST_F(LoggerTest, LinesCarryLevelAndMessage) {
    logger::info("packed 3 items");
    logger::warn("rating out of range");
    ASSERT_EQ(logger::line_count(), 2u);
    const auto lines = logger::lines();
    EXPECT_NE(lines[0].find("[INFO] packed 3 items"), std::string::npos);
    EXPECT_NE(lines[1].find("[WARN] rating out of range"), std::string::npos);
    EXPECT_EQ(lines[0].front(), '[');
    EXPECT_EQ(lines[0].back(), '\n');
}

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
    logger::set_level(logger::Level::Warn);
    EXPECT_EQ(logger::level(), logger::Level::Warn);
    logger::info("dropped");
    logger::warn("kept");
    logger::error("kept too");
    EXPECT_EQ(logger::line_count(), 2u);

    logger::set_level(logger::Level::Error);
    logger::warn("dropped");
    logger::error("always");
    EXPECT_EQ(logger::line_count(), 3u);
}

TEST_F(LoggerTest, RingBufferKeepsTheNewestLines) {
    for (int i = 0; i < 2105; ++i) {
        logger::info("line " + std::to_string(i));
    }
    const auto lines = logger::lines();
    ASSERT_EQ(lines.size(), 2000u);
    EXPECT_NE(lines.front().find("line 105\n"), std::string::npos);
    EXPECT_NE(lines.back().find("line 2104\n"), std::string::npos);

    logger::clear();
    EXPECT_EQ(logger::line_count(), 0u);
}

TEST_F(LoggerTest, FileSinkAppends) {
    const std::string path = ::testing::TempDir() + "photogrid_logger_test.log";
    std::remove(path.c_str());

    logger::set_log_file(path);
    logger::info("first");
    logger::set_log_file("");
    logger::info("not in file");
    logger::set_log_file(path);
    logger::error("second");
    logger::set_log_file("");

    std::ifstream in(path);
    std::stringstream body;
    body << in.rdbuf();
    const std::string text = body.str();
    EXPECT_NE(text.find("[INFO] first"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] second"), std::string::npos);
    EXPECT_EQ(text.find("not in file"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggerTest, UnopenableFileFallsBackToBuffer) {
    logger::set_log_file(::testing::TempDir() + "no_such_dir/photogrid.log");
    logger::warn("still buffered");
    EXPECT_EQ(logger::line_count(), 1u);
}

} // namespace
