#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace shortener::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HttpRouter;

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    // Binds immediately; throws beast::system_error if the endpoint is unavailable.
    HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<const HttpRouter> router);

    void run();

    tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    std::shared_ptr<const HttpRouter> router_;
};

}
