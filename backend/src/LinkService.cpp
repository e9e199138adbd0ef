#include "shortener/LinkService.hpp"
#include "shortener/CodeGenerator.hpp"
#include "shortener/RedirectResolver.hpp"
#include "shortener/UrlStore.hpp"
#include "shortener/errors.hpp"
#include "shortener/logging/LogRegistry.hpp"
#include "shortener/util/parse.hpp"
#include "shortener/util/time.hpp"

#include <cctype>
#include <optional>
#include <utility>

using namespace shortener::logging;

namespace shortener {

LinkService::LinkService(const UrlStore& store, config::ShortenerConfig cnf, CodeSource codes)
    : store_(store), cnf_(std::move(cnf)), codes_(std::move(codes)) {
    if (!codes_) codes_ = [](const std::size_t length) { return CodeGenerator::generate(length); };
}

ShortLink LinkService::createLink(const CreateLinkRequest& req) const {
    const auto long_url = util::trim(req.long_url);
    if (long_url.empty()) throw ValidationError("A URL is required.");
    for (const char c : long_url)
        if (std::iscntrl(static_cast<unsigned char>(c))) throw ValidationError("URL contains invalid characters.");

    std::optional<Timestamp> expiration;
    const auto expiration_date = util::trim(req.expiration_date);
    if (!expiration_date.empty()) {
        expiration = util::parseIsoDate(expiration_date);
        if (!expiration) throw ValidationError("Invalid expiration date.");
    }

    const auto custom_code = util::trim(req.custom_code);
    if (!custom_code.empty()) {
        if (!isValidCustomCode(custom_code)) throw ValidationError("Custom code contains invalid characters.");
        return store_.create(long_url, custom_code, expiration);
    }

    for (unsigned int attempt = 1;; ++attempt) {
        const auto short_code = codes_(cnf_.code_length);
        try {
            return store_.create(long_url, short_code, expiration);
        } catch (const DuplicateCodeError&) {
            if (attempt >= cnf_.max_generate_attempts) {
                LogRegistry::shortener()->warn("[LinkService] No free code after {} attempts", attempt);
                throw;
            }
            LogRegistry::shortener()->debug("[LinkService] Generated code '{}' collided, retrying", short_code);
        }
    }
}

std::string LinkService::shortUrl(const std::string& scheme, const std::string& host, const std::string& short_code) {
    return scheme + "://" + host + "/" + util::url_encode(short_code);
}

bool LinkService::isValidCustomCode(const std::string& code) {
    if (code.empty() || code.back() == RedirectResolver::PREVIEW_MARKER) return false;
    for (const char c : code) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '?' || c == '#' || std::isspace(uc) || std::iscntrl(uc)) return false;
    }
    return true;
}

}
