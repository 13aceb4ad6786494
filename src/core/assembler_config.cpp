#include "assembler_config.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

using json = nlohmann::json;

LogLevel parseLogLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::LVL_DEBUG;
    if (lower == "info")  return LogLevel::LVL_INFO;
    if (lower == "warn")  return LogLevel::LVL_WARN;
    if (lower == "error") return LogLevel::LVL_ERROR;
    throw ConfigError("unknown log level: " + text);
}

AssemblerConfig loadConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    AssemblerConfig config;
    try {
        json j = json::parse(ifs);
        if (!j.is_object()) {
            throw ConfigError("config root must be a JSON object: " + path);
        }

        if (j.contains("max_chunk_size")) {
            config.max_chunk_size = j.at("max_chunk_size").get<int64_t>();
        }
        if (j.contains("copy_buffer_size")) {
            int64_t size = j.at("copy_buffer_size").get<int64_t>();
            if (size <= 0) {
                throw ConfigError("copy_buffer_size must be > 0");
            }
            config.copy_buffer_size = static_cast<size_t>(size);
        }
        if (j.contains("remove_merged_segments")) {
            config.remove_merged_segments = j.at("remove_merged_segments").get<bool>();
        }
        if (j.contains("log_file")) {
            config.log_file = j.at("log_file").get<std::string>();
        }
        if (j.contains("log_level")) {
            config.log_level = parseLogLevel(j.at("log_level").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ConfigError("invalid config " + path + ": " + e.what());
    }

    if (config.max_chunk_size <= 0) {
        throw ConfigError("max_chunk_size must be > 0");
    }
    return config;
}
