#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <spdlog/spdlog.h>

namespace shortener::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    unsigned int threads = 1;
};

struct DatabaseConfig {
    std::string path = "urls.db";
    int busy_timeout_ms = 5000;
};

struct ShortenerConfig {
    std::size_t code_length = 6;
    unsigned int max_generate_attempts = 10;
    std::size_t recent_limit = 10;
};

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file;   // empty: console only
};

struct Config {
    ServerConfig server;
    DatabaseConfig database;
    ShortenerConfig shortener;
    LoggingConfig logging;
};

// Missing file yields the defaults; anything unparsable throws ConfigError.
Config loadConfig(const std::string& path);

Config parseConfig(const std::string& yaml);

}
