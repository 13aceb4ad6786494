#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <fstream>

// NOTE: Avoid bare ERROR – it conflicts with the ERROR macro from <windows.h>.
enum class LogLevel { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR };

/// Destination for diagnostic messages. Components receive a LogSink*
/// from their owner instead of reaching for a global.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { log(LogLevel::LVL_DEBUG, message); }
    void info(const std::string& message)  { log(LogLevel::LVL_INFO, message); }
    void warn(const std::string& message)  { log(LogLevel::LVL_WARN, message); }
    void error(const std::string& message) { log(LogLevel::LVL_ERROR, message); }
};

class Logger : public LogSink {
public:
    explicit Logger(LogLevel min_level = LogLevel::LVL_INFO);

    // Non-copyable (owns the file handle and the mutex).
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// Set (or change) the log output file path.
    /// Opens the file in append mode. Closes any previously opened file.
    /// An empty path just closes the current file.
    /// Returns false if the new file could not be opened.
    bool setLogFile(const std::string& path);

    /// Mirror every accepted line to stderr (used by the command-line tool).
    void setEchoToStderr(bool enabled);

    /// Messages below this level are dropped.
    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    /// Format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message\n"
    void log(LogLevel level, const std::string& message) override;

    /// Return the most recent log lines (up to count).
    std::vector<std::string> getRecentLogs(int count = 100) const;

    static const char* levelToString(LogLevel level);

private:
    static std::string currentTimestamp();

    mutable std::mutex mutex_;
    std::ofstream file_;
    bool echo_stderr_ = false;
    LogLevel min_level_;
    std::deque<std::string> recent_logs_;
    static constexpr int MAX_RECENT = 1000;
};
