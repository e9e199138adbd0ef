#include "shortener/util/time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace shortener::util {

namespace {

bool isLeap(const int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int daysInMonth(const int year, const int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeap(year)) return 29;
    return days[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian civil date.
int64_t daysFromCivil(int64_t y, const unsigned m, const unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

}

int64_t toUnixSeconds(const Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

Timestamp fromUnixSeconds(const int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

std::optional<Timestamp> parseIsoDate(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return std::nullopt;
    for (const auto i : {0, 1, 2, 3, 5, 6, 8, 9})
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return std::nullopt;

    const int year = std::stoi(date.substr(0, 4));
    const int month = std::stoi(date.substr(5, 2));
    const int day = std::stoi(date.substr(8, 2));
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    const auto days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return fromUnixSeconds(days * 86400);
}

std::string formatIsoDate(const Timestamp tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char out[16];
    std::strftime(out, sizeof(out), "%Y-%m-%d", &tm_buf);
    return out;
}

}
