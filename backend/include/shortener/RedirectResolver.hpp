#pragma once

#include "shortener/ShortLink.hpp"

#include <functional>
#include <string>

namespace shortener {

class UrlStore;
class ExpirationSweeper;

using NowFn = std::function<Timestamp()>;

struct LinkTarget {
    std::string short_code;
    bool preview = false;
};

struct Resolution {
    enum class Outcome { NotFound, Preview, Redirect };

    Outcome outcome = Outcome::NotFound;
    ShortLink link;   // unset for NotFound
};

class RedirectResolver {
public:
    static constexpr char PREVIEW_MARKER = '+';

    RedirectResolver(const UrlStore& store, const ExpirationSweeper& sweeper, NowFn now = &Clock::now);

    // "abc123+" -> {"abc123", preview}. Only one trailing marker is stripped.
    static LinkTarget parseTarget(const std::string& path_segment);

    // Sweeps, then looks the code up. Redirect bumps the click counter, Preview never does.
    Resolution resolve(const std::string& short_code, bool is_preview) const;
    Resolution resolve(const LinkTarget& target) const { return resolve(target.short_code, target.preview); }

private:
    const UrlStore& store_;
    const ExpirationSweeper& sweeper_;
    NowFn now_;
};

}
