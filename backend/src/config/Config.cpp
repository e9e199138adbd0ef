#include "shortener/config/Config.hpp"
#include "shortener/config/config_yaml.hpp"
#include "shortener/errors.hpp"

#include <fstream>

namespace shortener::config {

namespace {

void validate(const Config& cnf) {
    if (cnf.server.threads == 0) throw ConfigError("server.threads must be at least 1");
    if (cnf.shortener.code_length == 0) throw ConfigError("shortener.code_length must be at least 1");
    if (cnf.shortener.max_generate_attempts == 0)
        throw ConfigError("shortener.max_generate_attempts must be at least 1");
    if (cnf.shortener.recent_limit == 0) throw ConfigError("shortener.recent_limit must be at least 1");
    if (cnf.database.path.empty()) throw ConfigError("database.path must not be empty");
    if (cnf.database.busy_timeout_ms < 0) throw ConfigError("database.busy_timeout_ms must not be negative");
}

Config fromNode(const YAML::Node& root) {
    Config cnf;
    try {
        if (root && !root.IsNull()) cnf = root.as<Config>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
    validate(cnf);
    return cnf;
}

}

Config loadConfig(const std::string& path) {
    if (!std::ifstream(path).good()) return {};

    try {
        return fromNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load " + path + ": " + e.what());
    }
}

Config parseConfig(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

}
