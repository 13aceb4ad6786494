#include <gtest/gtest.h>
#include "logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <regex>

namespace fs = std::filesystem;

// Helper: read entire file into a string.
static std::string readFile(const std::string& path) {
    std::ifstream f(path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        log_path_ = (fs::temp_directory_path() / (std::string("segasm_logger_") + info->name() + ".log")).string();
        fs::remove(log_path_);
    }

    void TearDown() override {
        fs::remove(log_path_);
    }

    std::string log_path_;
};

TEST_F(LoggerTest, LogWritesToFileWithTimestampAndLevel) {
    Logger log;
    ASSERT_TRUE(log.setLogFile(log_path_));
    log.info("hello world");

    std::string content = readFile(log_path_);
    // Expect format: [YYYY-MM-DD HH:MM:SS] [INFO] hello world
    std::regex pattern(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] \[INFO\] hello world)");
    EXPECT_TRUE(std::regex_search(content, pattern));
}

TEST_F(LoggerTest, AllLogLevelsWriteCorrectTag) {
    Logger log(LogLevel::LVL_DEBUG);
    ASSERT_TRUE(log.setLogFile(log_path_));
    log.debug("d");
    log.info("i");
    log.warn("w");
    log.error("e");

    std::string content = readFile(log_path_);
    EXPECT_NE(content.find("[DEBUG] d"), std::string::npos);
    EXPECT_NE(content.find("[INFO] i"), std::string::npos);
    EXPECT_NE(content.find("[WARN] w"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] e"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBelowMinLevelAreDropped) {
    Logger log(LogLevel::LVL_WARN);
    log.debug("quiet");
    log.info("also quiet");
    log.warn("loud");

    auto logs = log.getRecentLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("loud"), std::string::npos);

    log.setMinLevel(LogLevel::LVL_DEBUG);
    EXPECT_EQ(log.minLevel(), LogLevel::LVL_DEBUG);
    log.debug("now visible");
    EXPECT_EQ(log.getRecentLogs().size(), 2u);
}

TEST_F(LoggerTest, InstancesAreIndependent) {
    Logger a;
    Logger b;
    a.info("only in a");
    EXPECT_EQ(a.getRecentLogs().size(), 1u);
    EXPECT_TRUE(b.getRecentLogs().empty());
}

TEST_F(LoggerTest, UsableThroughSinkInterface) {
    Logger log;
    LogSink& sink = log;
    sink.warn("via sink");
    auto logs = log.getRecentLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("[WARN] via sink"), std::string::npos);
}

TEST_F(LoggerTest, EmptyPathClosesFile) {
    Logger log;
    ASSERT_TRUE(log.setLogFile(log_path_));
    log.info("first");
    EXPECT_TRUE(log.setLogFile(""));
    log.info("second");

    std::string content = readFile(log_path_);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_EQ(content.find("second"), std::string::npos);
}

TEST_F(LoggerTest, UnopenableFileReportsFailure) {
    Logger log;
    EXPECT_FALSE(log.setLogFile((fs::temp_directory_path() / "segasm_no_dir" / "x.log").string()));
}

TEST_F(LoggerTest, GetRecentLogsReturnsLatestEntries) {
    Logger log;
    for (int i = 0; i < 5; ++i) {
        log.info("msg" + std::to_string(i));
    }

    auto logs = log.getRecentLogs(3);
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_NE(logs[0].find("msg2"), std::string::npos);
    EXPECT_NE(logs[1].find("msg3"), std::string::npos);
    EXPECT_NE(logs[2].find("msg4"), std::string::npos);
}

TEST_F(LoggerTest, GetRecentLogsNonPositiveCountIsEmpty) {
    Logger log;
    log.info("a");
    log.info("b");
    EXPECT_TRUE(log.getRecentLogs(0).empty());
    EXPECT_TRUE(log.getRecentLogs(-5).empty());
}

TEST_F(LoggerTest, RecentLogsAreBounded) {
    Logger log;
    for (int i = 0; i < 1200; ++i) {
        log.info("m" + std::to_string(i));
    }
    auto logs = log.getRecentLogs(5000);
    ASSERT_EQ(logs.size(), 1000u);
    EXPECT_NE(logs.front().find("m200"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    Logger log;
    ASSERT_TRUE(log.setLogFile(log_path_));

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &log]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                log.info("t" + std::to_string(t) + "_m" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::string content = readFile(log_path_);
    int line_count = 0;
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) ++line_count;
    }
    EXPECT_EQ(line_count, kThreads * kMessagesPerThread);
}
