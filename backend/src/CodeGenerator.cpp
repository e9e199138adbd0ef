#include "shortener/CodeGenerator.hpp"

#include <random>

namespace shortener {

const std::string& CodeGenerator::alphabet() {
    static const std::string chars =
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "0123456789";
    return chars;
}

std::string CodeGenerator::generate(const std::size_t length) {
    const auto& chars = alphabet();

    // One engine per worker thread; the io_context may run on several.
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, chars.size() - 1);

    std::string code;
    code.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        code += chars[dist(gen)];
    }
    return code;
}

}
