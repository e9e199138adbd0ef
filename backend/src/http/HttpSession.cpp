#include "shortener/http/HttpSession.hpp"
#include "shortener/http/HttpRouter.hpp"
#include "shortener/logging/LogRegistry.hpp"

using namespace shortener::logging;

namespace shortener::http {

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<const HttpRouter> router)
    : socket_(std::move(socket)), router_(std::move(router)) {}

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    req_ = {};

    auto self = shared_from_this();
    http::async_read(socket_, buffer_, req_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        LogRegistry::http()->debug("[HttpSession] Read error: {}", ec.message());
        return do_close();
    }

    const std::string target(req_.target());
    LogRegistry::http()->debug("[HttpSession] Read {} bytes: {}", bytes, target);

    auto res = std::make_shared<http::response<http::string_body>>();
    try {
        *res = router_->route(req_);
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[HttpSession] Exception during request handling: {}", e.what());
        *res = HttpRouter::makeTextResponse(req_, http::status::internal_server_error, "Internal server error");
        res->keep_alive(false);
    }

    const std::string method(req_.method_string());
    LogRegistry::http()->info("{} {} -> {}", method, target, res->result_int());

    const bool close = res->need_eof();
    auto self = shared_from_this();
    http::async_write(socket_, *res,
                      [self, res, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void HttpSession::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        LogRegistry::http()->error("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
