#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace shortener::config { struct LoggingConfig; }

namespace shortener::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> shortener() { return get("shortener"); }
    static std::shared_ptr<spdlog::logger> http()      { return get("http"); }
    static std::shared_ptr<spdlog::logger> db()        { return get("db"); }

    [[nodiscard]] static bool isInitialized();

private:
    static inline bool initialized_ = false;
};

} // namespace shortener::logging
