#include "shortener/RedirectResolver.hpp"
#include "shortener/ExpirationSweeper.hpp"
#include "shortener/UrlStore.hpp"

#include <utility>

namespace shortener {

RedirectResolver::RedirectResolver(const UrlStore& store, const ExpirationSweeper& sweeper, NowFn now)
    : store_(store), sweeper_(sweeper), now_(std::move(now)) {}

LinkTarget RedirectResolver::parseTarget(const std::string& path_segment) {
    LinkTarget target{path_segment, false};
    if (!target.short_code.empty() && target.short_code.back() == PREVIEW_MARKER) {
        target.short_code.pop_back();
        target.preview = true;
    }
    return target;
}

Resolution RedirectResolver::resolve(const std::string& short_code, const bool is_preview) const {
    sweeper_.sweep(now_());

    Resolution res;
    auto link = store_.getByCode(short_code);
    if (!link) return res;

    if (is_preview) {
        res.outcome = Resolution::Outcome::Preview;
        res.link = std::move(*link);
        return res;
    }

    // Swept or deleted between the lookup and the update.
    if (!store_.incrementClicks(short_code)) return res;

    ++link->clicks;
    res.outcome = Resolution::Outcome::Redirect;
    res.link = std::move(*link);
    return res;
}

}
