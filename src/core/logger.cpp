#include "logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <iostream>

Logger::Logger(LogLevel min_level)
    : min_level_(min_level)
{
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::setEchoToStderr(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    echo_stderr_ = enabled;
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::minLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::log(LogLevel level, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }
    }

    std::ostringstream oss;
    oss << "[" << currentTimestamp() << "] [" << levelToString(level) << "] " << message;
    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open()) {
        file_ << line << "\n";
        file_.flush();
    }
    if (echo_stderr_) {
        std::cerr << line << std::endl;
    }

    recent_logs_.push_back(std::move(line));
    if (static_cast<int>(recent_logs_.size()) > MAX_RECENT) {
        recent_logs_.pop_front();
    }
}

std::vector<std::string> Logger::getRecentLogs(int count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = static_cast<int>(recent_logs_.size());
    if (count < 0) {
        count = 0;
    }
    int start = (count >= n) ? 0 : n - count;
    return std::vector<std::string>(recent_logs_.begin() + start, recent_logs_.end());
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::LVL_DEBUG: return "DEBUG";
        case LogLevel::LVL_INFO:  return "INFO";
        case LogLevel::LVL_WARN:  return "WARN";
        case LogLevel::LVL_ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
