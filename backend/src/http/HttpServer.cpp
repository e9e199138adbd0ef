#include "shortener/http/HttpServer.hpp"
#include "shortener/http/HttpSession.hpp"
#include "shortener/logging/LogRegistry.hpp"

using namespace shortener::logging;

namespace shortener::http {

HttpServer::HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const HttpRouter> router)
    : acceptor_(ioc), router_(std::move(router)) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void HttpServer::run() {
    const auto endpoint = acceptor_.local_endpoint();
    LogRegistry::http()->info("[HttpServer] Listening on {}:{}", endpoint.address().to_string(), endpoint.port());
    do_accept();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), self->router_)->run();
            } else if (ec == net::error::operation_aborted) {
                return;
            } else {
                LogRegistry::http()->warn("[HttpServer] Accept failed: {}", ec.message());
            }
            self->do_accept();
        });
}

}
