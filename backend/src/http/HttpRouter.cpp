#include "shortener/http/HttpRouter.hpp"
#include "shortener/ExpirationSweeper.hpp"
#include "shortener/LinkService.hpp"
#include "shortener/UrlStore.hpp"
#include "shortener/errors.hpp"
#include "shortener/logging/LogRegistry.hpp"
#include "shortener/util/parse.hpp"

#include <utility>

using namespace shortener::logging;

namespace shortener::http {

namespace {

constexpr auto SERVER_NAME = "URLShortener/1.0";
constexpr auto DUPLICATE_CODE_MESSAGE = "Custom code already exists.";

std::string toString(const boost::beast::string_view sv) { return {sv.data(), sv.size()}; }

std::string formValue(const util::Params& form, const std::string& key) {
    const auto it = form.find(key);
    return it == form.end() ? std::string() : it->second;
}

}

HttpRouter::HttpRouter(const UrlStore& store,
                       const ExpirationSweeper& sweeper,
                       const RedirectResolver& resolver,
                       const LinkService& links,
                       std::string fallback_host,
                       NowFn now)
    : store_(store), sweeper_(sweeper), resolver_(resolver), links_(links),
      fallback_host_(std::move(fallback_host)), now_(std::move(now)) {}

Response HttpRouter::route(const Request& req) const {
    std::string path;
    try {
        path = util::url_decode(util::target_path(toString(req.target())), /*plus_as_space=*/false);
    } catch (const ValidationError& e) {
        return makeTextResponse(req, http::status::bad_request, e.what());
    }

    if (path.empty() || path.front() != '/') return makeTextResponse(req, http::status::bad_request, "Invalid request");

    try {
        if (path == "/") {
            if (req.method() == http::verb::get) return handleIndex(req);
            if (req.method() == http::verb::post) return handleCreate(req);
        } else if (path == "/delete" && req.method() == http::verb::post) {
            return handleDelete(req);
        } else if (req.method() == http::verb::get) {
            return handleLink(req, path);
        }
    } catch (const ValidationError& e) {
        // Malformed query string or form body.
        return makeTextResponse(req, http::status::bad_request, e.what());
    }

    auto res = makeTextResponse(req, http::status::method_not_allowed, "Method not allowed");
    res.set(http::field::allow, path == "/" || path == "/delete" ? "GET, POST" : "GET");
    return res;
}

Response HttpRouter::handleIndex(const Request& req) const {
    sweeper_.sweep(now_());

    IndexView view;
    const auto params = util::parse_query_params(toString(req.target()));
    if (const auto it = params.find("created"); it != params.end() && !it->second.empty())
        view.short_url = LinkService::shortUrl(requestScheme(req), requestHost(req), it->second);

    return renderIndexPage(req, std::move(view), http::status::ok);
}

Response HttpRouter::handleCreate(const Request& req) const {
    sweeper_.sweep(now_());

    const auto form = util::parse_form(req.body());

    CreateLinkRequest create;
    create.long_url = formValue(form, "long_url");
    create.custom_code = formValue(form, "custom_code");
    create.expiration_date = formValue(form, "expiration_date");

    IndexView view;
    view.long_url = create.long_url;
    view.custom_code = create.custom_code;
    view.expiration_date = create.expiration_date;

    try {
        const auto link = links_.createLink(create);
        LogRegistry::http()->info("[HttpRouter] Created '{}' -> {}", link.short_code, link.long_url);
        return makeRedirect(req, http::status::see_other, "/?created=" + util::url_encode(link.short_code));
    } catch (const DuplicateCodeError&) {
        view.error = DUPLICATE_CODE_MESSAGE;
        return renderIndexPage(req, std::move(view), http::status::ok);
    } catch (const ValidationError& e) {
        view.error = e.what();
        return renderIndexPage(req, std::move(view), http::status::bad_request);
    }
}

Response HttpRouter::handleDelete(const Request& req) const {
    const auto form = util::parse_form(req.body());
    const auto it = form.find("short_code");
    if (it == form.end() || it->second.empty())
        return makeTextResponse(req, http::status::bad_request, "Missing short_code");

    store_.remove(it->second);
    LogRegistry::http()->info("[HttpRouter] Delete requested for '{}'", it->second);
    return makeRedirect(req, http::status::see_other, "/");
}

Response HttpRouter::handleLink(const Request& req, const std::string& path) const {
    const auto target = RedirectResolver::parseTarget(path.substr(1));
    const auto res = resolver_.resolve(target);

    switch (res.outcome) {
        case Resolution::Outcome::Redirect:
            return makeRedirect(req, http::status::found, res.link.long_url);
        case Resolution::Outcome::Preview:
            return makeHtmlResponse(req, http::status::ok, renderPreview(res.link));
        case Resolution::Outcome::NotFound:
            break;
    }
    return makeTextResponse(req, http::status::not_found, "URL not found");
}

Response HttpRouter::renderIndexPage(const Request& req, IndexView view, const http::status status) const {
    view.history = store_.listRecent(links_.config().recent_limit);
    return makeHtmlResponse(req, status, renderIndex(view));
}

Response HttpRouter::makeTextResponse(const Request& req, const http::status status, const std::string& body) {
    Response res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

Response HttpRouter::makeHtmlResponse(const Request& req, const http::status status, std::string body) {
    Response res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/html; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response HttpRouter::makeRedirect(const Request& req, const http::status status, const std::string& location) {
    Response res{status, req.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::location, location);
    res.set(http::field::cache_control, "no-store");
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

std::string HttpRouter::requestScheme(const Request& req) const {
    const auto it = req.find("X-Forwarded-Proto");
    if (it != req.end()) {
        const auto proto = util::trim(toString(it->value()));
        if (proto == "http" || proto == "https") return proto;
    }
    return "http";
}

std::string HttpRouter::requestHost(const Request& req) const {
    const auto it = req.find(http::field::host);
    if (it != req.end() && !it->value().empty()) return toString(it->value());
    return fallback_host_;
}

}
