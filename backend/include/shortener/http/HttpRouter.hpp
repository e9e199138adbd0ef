#pragma once

#include "shortener/RedirectResolver.hpp"
#include "shortener/http/Pages.hpp"

#include <boost/beast/http.hpp>
#include <string>

namespace shortener {
class UrlStore;
class ExpirationSweeper;
class LinkService;
}

namespace shortener::http {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Maps requests to the shortener operations:
//   GET  /             landing page and recent links
//   POST /             create a link
//   POST /delete       delete a link
//   GET  /<code>       redirect
//   GET  /<code>+      preview
class HttpRouter {
public:
    HttpRouter(const UrlStore& store,
               const ExpirationSweeper& sweeper,
               const RedirectResolver& resolver,
               const LinkService& links,
               std::string fallback_host,
               NowFn now = &Clock::now);

    Response route(const Request& req) const;

    static Response makeTextResponse(const Request& req, http::status status, const std::string& body);

private:
    Response handleIndex(const Request& req) const;
    Response handleCreate(const Request& req) const;
    Response handleDelete(const Request& req) const;
    Response handleLink(const Request& req, const std::string& path) const;

    Response renderIndexPage(const Request& req, IndexView view, http::status status) const;

    static Response makeHtmlResponse(const Request& req, http::status status, std::string body);
    static Response makeRedirect(const Request& req, http::status status, const std::string& location);

    std::string requestScheme(const Request& req) const;
    std::string requestHost(const Request& req) const;

    const UrlStore& store_;
    const ExpirationSweeper& sweeper_;
    const RedirectResolver& resolver_;
    const LinkService& links_;
    std::string fallback_host_;
    NowFn now_;
};

}
