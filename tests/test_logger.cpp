#include <gtest/gtest.h>
#include "logger.h"

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

int countLines(const std::string& text) {
    int n = 0;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = (fs::temp_directory_path() / "blockrange_test_logger.log").string();
        fs::remove(log_path_);
        ASSERT_TRUE(Logger::instance().setLogFile(log_path_));
    }

    void TearDown() override {
        Logger::instance().setLogFile("");
        Logger::instance().setMinLevel(LogLevel::LVL_INFO);
        fs::remove(log_path_);
    }

    std::string log_path_;
};

TEST_F(LoggerTest, LineCarriesTimestampLevelAndThreadLabel) {
    Logger::instance().info("GET /obj range=0-99");

    std::regex pattern(
        R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[INFO\] \[main\] GET /obj range=0-99)");
    EXPECT_TRUE(std::regex_search(readFile(log_path_), pattern));
}

TEST_F(LoggerTest, ThreadLabelIsPerThread) {
    std::thread worker([] {
        setThreadLogLabel("block-fetch-7");
        Logger::instance().warn("origin slow");
    });
    worker.join();
    Logger::instance().info("after join");

    const std::string content = readFile(log_path_);
    EXPECT_NE(content.find("[WARN] [block-fetch-7] origin slow"), std::string::npos);
    EXPECT_NE(content.find("[INFO] [main] after join"), std::string::npos);
}

TEST_F(LoggerTest, DebugDroppedAtDefaultLevel) {
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::LVL_DEBUG));
    Logger::instance().debug("cache miss blk/4:/obj/100/0");
    Logger::instance().error("assembly mismatch");

    const std::string content = readFile(log_path_);
    EXPECT_EQ(content.find("cache miss"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [main] assembly mismatch"), std::string::npos);
}

TEST_F(LoggerTest, MinLevelFiltersLowerLevels) {
    Logger::instance().setMinLevel(LogLevel::LVL_WARN);
    EXPECT_EQ(Logger::instance().minLevel(), LogLevel::LVL_WARN);
    Logger::instance().info("skipped");
    Logger::instance().warn("kept");
    EXPECT_EQ(countLines(readFile(log_path_)), 1);

    Logger::instance().setMinLevel(LogLevel::LVL_DEBUG);
    EXPECT_TRUE(Logger::instance().enabled(LogLevel::LVL_DEBUG));
    Logger::instance().debug("now shown");
    EXPECT_NE(readFile(log_path_).find("[DEBUG] [main] now shown"), std::string::npos);
}

TEST_F(LoggerTest, RecentLogsKeepNewestInOrder) {
    for (int i = 0; i < 5; ++i) {
        Logger::instance().info("request " + std::to_string(i));
    }

    auto recent = Logger::instance().getRecentLogs(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_NE(recent[0].find("request 2"), std::string::npos);
    EXPECT_NE(recent[2].find("request 4"), std::string::npos);

    EXPECT_TRUE(Logger::instance().getRecentLogs(0).empty());
    EXPECT_LE(Logger::instance().getRecentLogs(5000).size(), 1000u);
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    constexpr int kThreads = 8;
    constexpr int kLinesEach = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            setThreadLogLabel("w" + std::to_string(t));
            for (int i = 0; i < kLinesEach; ++i) {
                Logger::instance().info("block " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();

    const std::string content = readFile(log_path_);
    EXPECT_EQ(countLines(content), kThreads * kLinesEach);
    std::istringstream iss(content);
    std::string line;
    std::regex shape(R"(^\[[^\]]+\] \[INFO\] \[w\d\] block \d+$)");
    while (std::getline(iss, line)) {
        EXPECT_TRUE(std::regex_match(line, shape)) << line;
    }
}

TEST_F(LoggerTest, UnopenableFileIsReported) {
    EXPECT_FALSE(Logger::instance().setLogFile("/nonexistent-dir/sub/log.txt"));
    EXPECT_TRUE(Logger::instance().setLogFile(""));
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::LVL_DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::LVL_INFO);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::LVL_WARN);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::LVL_ERROR);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
    EXPECT_STREQ(logLevelName(LogLevel::LVL_WARN), "WARN");
}
