#pragma once

#include "shortener/config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace shortener::config;

// Present-but-unconvertible values throw instead of falling back silently.
template<typename T, typename D>
T value_or(const Node& node, const char* key, const D& fallback) {
    const auto child = node[key];
    return child ? child.as<T>() : static_cast<T>(fallback);
}

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["threads"] = rhs.threads;
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = value_or<std::string>(node, "host", "0.0.0.0");
        rhs.port = value_or<uint16_t>(node, "port", 5000);
        rhs.threads = value_or<unsigned int>(node, "threads", 1);
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["path"] = rhs.path;
        node["busy_timeout_ms"] = rhs.busy_timeout_ms;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = value_or<std::string>(node, "path", "urls.db");
        rhs.busy_timeout_ms = value_or<int>(node, "busy_timeout_ms", 5000);
        return true;
    }
};

template<>
struct convert<ShortenerConfig> {
    static Node encode(const ShortenerConfig& rhs) {
        Node node;
        node["code_length"] = rhs.code_length;
        node["max_generate_attempts"] = rhs.max_generate_attempts;
        node["recent_limit"] = rhs.recent_limit;
        return node;
    }

    static bool decode(const Node& node, ShortenerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.code_length = value_or<std::size_t>(node, "code_length", 6);
        rhs.max_generate_attempts = value_or<unsigned int>(node, "max_generate_attempts", 10);
        rhs.recent_limit = value_or<std::size_t>(node, "recent_limit", 10);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["level"] = to_std_string(spdlog::level::to_string_view(rhs.level));
        node["file"] = rhs.file;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto level = value_or<std::string>(node, "level", "info");
        rhs.level = spdlog::level::from_str(level);
        if (rhs.level == spdlog::level::off && level != "off") return false;  // unknown level name
        rhs.file = value_or<std::string>(node, "file", "");
        return true;
    }
};

template<>
struct convert<Config> {
    static Node encode(const Config& rhs) {
        Node node;
        node["server"] = rhs.server;
        node["database"] = rhs.database;
        node["shortener"] = rhs.shortener;
        node["logging"] = rhs.logging;
        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) return false;
        if (node["server"]) rhs.server = node["server"].as<ServerConfig>();
        if (node["database"]) rhs.database = node["database"].as<DatabaseConfig>();
        if (node["shortener"]) rhs.shortener = node["shortener"].as<ShortenerConfig>();
        if (node["logging"]) rhs.logging = node["logging"].as<LoggingConfig>();
        return true;
    }
};

}
