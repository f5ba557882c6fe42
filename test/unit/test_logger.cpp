#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>

#include "test_helpers.hpp"
#include "util/logger.hpp"

namespace {

using namespace chunkworker::util::logger;

// Restores the suite-wide logger settings chosen in test_runner.cpp
class LoggerTest : public ::testing::Test
{
protected:
    void TearDown() override
    {
        disableFileOutput();
        setLogLevel(LogLevel::WARN);
    }
};

TEST_F(LoggerTest, LevelNamesParse) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_STREQ(levelName(LogLevel::WARN), "WARN");
    EXPECT_THROW(parseLogLevel("info"), std::runtime_error);
}

TEST_F(LoggerTest, LineCarriesLevelAndThreadTag) {
    const std::string line = Logger::formatLine(LogLevel::ERROR, "[Test] something broke");
    EXPECT_NE(line.find("][ERROR][T"), std::string::npos);
    EXPECT_NE(line.find("] [Test] something broke\n"), std::string::npos);
}

TEST_F(LoggerTest, ThreadsGetDistinctTags) {
    const unsigned mine = threadTag();
    EXPECT_EQ(threadTag(), mine);
    unsigned other = 0;
    std::thread t([&other] { other = threadTag(); });
    t.join();
    EXPECT_NE(other, mine);
}

TEST_F(LoggerTest, FileOutputHonoursLevel) {
    chunkworker::test::TempDir dir("logger");
    const std::string path = dir.file("worker.log");

    ASSERT_TRUE(configure("INFO", path));
    Logger::getInstance().setConsoleOutput(false);
    debug("[Test] hidden");
    info("[Test] visible");
    Logger::getInstance().setConsoleOutput(true);
    disableFileOutput();

    const std::string content = chunkworker::test::readFile(path);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("[INFO]"), std::string::npos);
    EXPECT_NE(content.find("[Test] visible"), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileIsReported) {
    chunkworker::test::TempDir dir("logger_bad");
    EXPECT_FALSE(configure("WARN", (dir.path() / "missing_dir" / "worker.log").string()));
    EXPECT_EQ(Logger::getInstance().getLogLevel(), LogLevel::WARN);
}

} // namespace
