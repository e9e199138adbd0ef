#include "shortener/logging/LogRegistry.hpp"
#include "shortener/config/Config.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>
#include <vector>

namespace shortener::logging {

namespace {
constexpr auto LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_color_mode(spdlog::color_mode::automatic);
    console_sink->set_pattern(LOG_FORMAT);
    sinks.push_back(console_sink);

    if (!cnf.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cnf.file, /*truncate=*/false);
        file_sink->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink);
    }

    auto makeLogger = [&](const std::string& name) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(cnf.level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("shortener");
    makeLogger("http");
    makeLogger("db");

    initialized_ = true;
    get("shortener")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace shortener::logging
