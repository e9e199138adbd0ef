#pragma once

#include <cstddef>
#include <string>

namespace shortener {

class CodeGenerator {
public:
    static constexpr std::size_t DEFAULT_LENGTH = 6;

    static const std::string& alphabet();

    // Uniform draw from [a-zA-Z0-9]. Uniqueness is the store's job.
    static std::string generate(std::size_t length = DEFAULT_LENGTH);
};

}
