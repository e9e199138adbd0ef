#include "shortener/util/parse.hpp"
#include "shortener/errors.hpp"

#include <cctype>
#include <sstream>

namespace shortener::util {

namespace {

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Params parse_pairs(const std::string& query) {
    Params params;
    std::istringstream stream(query);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        if (eq != std::string::npos) params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        else params[url_decode(pair)] = "";
    }

    return params;
}

}

std::string trim(const std::string& value) {
    const auto is_space = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t begin = 0, end = value.size();
    while (begin < end && is_space(value[begin])) ++begin;
    while (end > begin && is_space(value[end - 1])) --end;
    return value.substr(begin, end - begin);
}

std::string url_decode(const std::string& value, const bool plus_as_space) {
    std::string result;
    result.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%') {
            if (i + 2 >= value.size()) throw ValidationError("Invalid percent-encoding in URL");
            const int hi = hexValue(value[i + 1]);
            const int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) throw ValidationError("Invalid percent-encoding in URL");
            result += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else if (value[i] == '+' && plus_as_space) result += ' ';
        else result += value[i];
    }

    return result;
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";

    std::string result;
    result.reserve(value.size());
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += ch;
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

std::string target_path(const std::string& target) {
    return target.substr(0, target.find('?'));
}

Params parse_query_params(const std::string& target) {
    const auto pos = target.find('?');
    if (pos == std::string::npos) return {};
    return parse_pairs(target.substr(pos + 1));
}

Params parse_form(const std::string& body) {
    return parse_pairs(body);
}

}
