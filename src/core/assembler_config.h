#pragma once

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "logger.h"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct AssemblerConfig {
    int64_t max_chunk_size = 4 * 1024 * 1024;   // largest range per connection
    size_t copy_buffer_size = 256 * 1024;       // merge read/write buffer
    bool remove_merged_segments = true;
    std::string log_file;                       // empty = no log file
    LogLevel log_level = LogLevel::LVL_INFO;
};

/// Load settings from a JSON object. Keys that are absent keep their
/// defaults. Throws ConfigError on a missing or unparsable file, a value of
/// the wrong type, or an out-of-range value.
AssemblerConfig loadConfig(const std::string& path);

/// "debug" | "info" | "warn" | "error" (case-insensitive). Throws ConfigError.
LogLevel parseLogLevel(const std::string& text);
