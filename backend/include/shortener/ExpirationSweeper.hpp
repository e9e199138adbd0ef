#pragma once

#include "shortener/ShortLink.hpp"

#include <cstddef>

namespace shortener {

class UrlStore;

// Purges expired links. Run in the request path right before the queries that
// must not see them, not on a timer.
class ExpirationSweeper {
public:
    explicit ExpirationSweeper(const UrlStore& store);

    std::size_t sweep(Timestamp now) const;

private:
    const UrlStore& store_;
};

}
