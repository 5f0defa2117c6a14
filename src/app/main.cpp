#include "segmux/app/server_config.h"
#include "segmux/core/http_request.h"
#include "segmux/core/http_response.h"
#include "segmux/core/http_router.h"
#include "segmux/core/log.h"
#include "segmux/core/request_context.h"
#include "segmux/infrastructure/net/http_session.h"
#include "segmux/infrastructure/net/io_thread_pool.h"
#include "segmux/infrastructure/net/listener.h"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace segmux;

namespace {

void register_routes(core::HttpRouter& router) {
    using core::HttpRequest;
    using core::HttpResponse;
    using core::RequestContext;

    router.add_route("GET", "/", [](HttpRequest&, HttpResponse& res, RequestContext&) {
        res.set_text("ok\n");
    });

    router.add_route("GET", "/posts", [](HttpRequest&, HttpResponse& res, RequestContext&) {
        res.set_json(R"({"posts":[]})");
    });

    router.add_route("POST", "/posts", [](HttpRequest& req, HttpResponse& res, RequestContext&) {
        res.set_status(201);
        res.set_json(req.body());
    });

    router.add_route("GET", "/posts/*", [](HttpRequest&, HttpResponse& res, RequestContext& ctx) {
        res.set_json(R"({"post":")" + core::path_parameter(ctx, 0) + R"("})");
    });

    router.add_route("GET", "/posts/*/comments", [](HttpRequest&, HttpResponse& res, RequestContext& ctx) {
        res.set_json(R"({"post":")" + core::path_parameter(ctx, 0) + R"(","comments":[]})");
    });

    router.add_route("*", "/echo", [](HttpRequest& req, HttpResponse& res, RequestContext&) {
        res.set_text(req.method() + " " + req.path() + "\n" + req.body());
    });
}

} // namespace

int main(int argc, char* argv[])
{
    app::ServerConfig config;
    try {
        if (!config.init_from(argc, argv, std::cout)) {
            return EXIT_SUCCESS;
        }
    } catch (const std::exception& e) {
        log::error("invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    log::set_level(config.level());

    auto router = std::make_shared<core::HttpRouter>();
    register_routes(*router);
    std::shared_ptr<const core::HttpRouter> shared_router = std::move(router);

    try {
        using infrastructure::net::HttpSession;
        using infrastructure::net::IoThreadPool;
        using infrastructure::net::Listener;

        IoThreadPool pool(config.threads);

        const auto endpoint = Listener::Tcp::endpoint{
            boost::asio::ip::make_address(config.address), config.port};

        auto listener = std::make_shared<Listener>(
            pool,
            endpoint,
            [shared_router](Listener::Tcp::socket socket) {
                return std::make_shared<HttpSession>(std::move(socket), shared_router);
            });
        listener->run();
        pool.start();

        // Block the main thread until SIGINT or SIGTERM
        boost::asio::io_context signals_ioc;
        boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [](const boost::system::error_code& ec, int signal) {
                if (!ec) {
                    log::info("signal {} received, shutting down", signal);
                }
            });
        signals_ioc.run();

        // Close the acceptor while the pool still runs its strand
        listener->stop();
        pool.stop();
    } catch (const std::exception& e) {
        log::critical("server failed: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
