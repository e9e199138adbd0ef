#pragma once

#include "shortener/ShortLink.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace shortener::util {

int64_t toUnixSeconds(Timestamp tp);
Timestamp fromUnixSeconds(int64_t seconds);

// "YYYY-MM-DD" -> midnight UTC of that day. nullopt if malformed or not a real date.
std::optional<Timestamp> parseIsoDate(const std::string& date);

// Date part of tp in UTC, "YYYY-MM-DD".
std::string formatIsoDate(Timestamp tp);

}
