#pragma once

#include <string>
#include <unordered_map>

namespace shortener::util {

using Params = std::unordered_map<std::string, std::string>;

std::string trim(const std::string& value);

// Throws ValidationError on malformed percent-escapes.
// Paths keep '+' literal; query strings and form bodies decode it as a space.
std::string url_decode(const std::string& value, bool plus_as_space = true);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& value);

// Path component of a request target, still encoded.
std::string target_path(const std::string& target);

Params parse_query_params(const std::string& target);

// application/x-www-form-urlencoded
Params parse_form(const std::string& body);

}
