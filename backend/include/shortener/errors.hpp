#pragma once

#include <stdexcept>
#include <string>

namespace shortener {

// Thrown by UrlStore::create when the short code is already taken.
class DuplicateCodeError : public std::runtime_error {
public:
    explicit DuplicateCodeError(const std::string& short_code)
        : std::runtime_error("Short code already exists: " + short_code), short_code_(short_code) {}

    const std::string& shortCode() const noexcept { return short_code_; }

private:
    std::string short_code_;
};

// Rejected user input; raised before anything reaches the store.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
