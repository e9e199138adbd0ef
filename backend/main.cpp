#include "shortener/ExpirationSweeper.hpp"
#include "shortener/LinkService.hpp"
#include "shortener/RedirectResolver.hpp"
#include "shortener/UrlStore.hpp"
#include "shortener/config/Config.hpp"
#include "shortener/http/HttpRouter.hpp"
#include "shortener/http/HttpServer.hpp"
#include "shortener/logging/LogRegistry.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using namespace shortener;
using namespace shortener::logging;

namespace {

constexpr auto DEFAULT_CONFIG_PATH = "config.yaml";

std::string fallbackHost(const config::ServerConfig& cnf) {
    const std::string host = cnf.host == "0.0.0.0" || cnf.host.empty() ? "localhost" : cnf.host;
    return host + ":" + std::to_string(cnf.port);
}

}

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

    config::Config cnf;
    try {
        cnf = config::loadConfig(config_path);
        LogRegistry::init(cnf.logging);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        LogRegistry::shortener()->info("=== URL Shortener Service ===");

        UrlStore store(cnf.database.path, cnf.database.busy_timeout_ms);
        store.initSchema();

        ExpirationSweeper sweeper(store);
        RedirectResolver resolver(store, sweeper);
        LinkService links(store, cnf.shortener);

        std::shared_ptr<const http::HttpRouter> router =
            std::make_shared<http::HttpRouter>(store, sweeper, resolver, links, fallbackHost(cnf.server));

        net::io_context ioc{static_cast<int>(cnf.server.threads)};
        const tcp::endpoint endpoint{net::ip::make_address(cnf.server.host), cnf.server.port};
        std::make_shared<http::HttpServer>(ioc, endpoint, router)->run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](const boost::system::error_code& ec, const int signal) {
            if (ec) return;
            LogRegistry::shortener()->info("Received signal {}, shutting down", signal);
            ioc.stop();
        });

        std::vector<std::thread> workers;
        workers.reserve(cnf.server.threads - 1);
        for (unsigned int i = 1; i < cnf.server.threads; ++i) workers.emplace_back([&ioc] { ioc.run(); });
        ioc.run();
        for (auto& t : workers) t.join();

        LogRegistry::shortener()->info("Stopped");
    } catch (const std::exception& e) {
        LogRegistry::shortener()->critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
