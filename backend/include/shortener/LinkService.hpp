#pragma once

#include "shortener/ShortLink.hpp"
#include "shortener/config/Config.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace shortener {

class UrlStore;

// Raw form input of a creation request. Empty strings mean "not supplied".
struct CreateLinkRequest {
    std::string long_url;
    std::string custom_code;
    std::string expiration_date;   // YYYY-MM-DD
};

class LinkService {
public:
    using CodeSource = std::function<std::string(std::size_t)>;

    LinkService(const UrlStore& store, config::ShortenerConfig cnf, CodeSource codes = {});

    /**
     * Validates the request and stores a new link.
     *
     * A custom code is used as given and a collision throws DuplicateCodeError.
     * Generated codes are redrawn on collision, up to max_generate_attempts times,
     * before the DuplicateCodeError is let through.
     *
     * @throws ValidationError on a missing URL, a bad date or an unroutable custom code.
     */
    ShortLink createLink(const CreateLinkRequest& req) const;

    static std::string shortUrl(const std::string& scheme, const std::string& host, const std::string& short_code);

    // Custom codes must survive the trip through a request path unchanged.
    static bool isValidCustomCode(const std::string& code);

    const config::ShortenerConfig& config() const { return cnf_; }

private:
    const UrlStore& store_;
    config::ShortenerConfig cnf_;
    CodeSource codes_;
};

}
