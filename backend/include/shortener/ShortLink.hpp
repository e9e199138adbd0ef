#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace shortener {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

struct ShortLink {
    int64_t id = 0;
    std::string long_url;
    std::string short_code;
    int64_t clicks = 0;
    std::optional<Timestamp> expiration;   // nullopt: never expires
};

}
