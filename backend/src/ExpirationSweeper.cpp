#include "shortener/ExpirationSweeper.hpp"
#include "shortener/UrlStore.hpp"
#include "shortener/logging/LogRegistry.hpp"
#include "shortener/util/time.hpp"

using namespace shortener::logging;

namespace shortener {

ExpirationSweeper::ExpirationSweeper(const UrlStore& store) : store_(store) {}

std::size_t ExpirationSweeper::sweep(const Timestamp now) const {
    const auto removed = store_.deleteExpired(now);
    if (removed > 0)
        LogRegistry::db()->info("[ExpirationSweeper] Removed {} expired link(s) as of {}",
                                removed, util::formatIsoDate(now));
    return removed;
}

}
