#include "segmux/infrastructure/net/listener.h"
#include "segmux/infrastructure/net/http_session.h"
#include "segmux/infrastructure/net/io_thread_pool.h"
#include "segmux/core/log.h"

#include <future>
#include <stdexcept>

namespace segmux::infrastructure::net {

Listener::Listener(
    IoThreadPool& pool,
    const Tcp::endpoint& endpoint,
    SessionFactory session_factory
)
    : pool_(pool)
    , strand_(boost::asio::make_strand(pool.io_context()))
    , acceptor_(strand_)
    , session_factory_(std::move(session_factory))
{
    boost::system::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Listener: open failed: " + ec.message());
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Listener: set_option failed: " + ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Listener: bind failed: " + ec.message());
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Listener: listen failed: " + ec.message());
    }
}

void Listener::run() {
    if (stopped_) {
        return;
    }
    log::info("listening on {}:{}",
              acceptor_.local_endpoint().address().to_string(),
              acceptor_.local_endpoint().port());
    do_accept();
}

void Listener::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true)) {
        return;
    }

    if (!pool_.running() || strand_.running_in_this_thread()) {
        close_acceptor();
        return;
    }

    if (pool_.io_context().get_executor().running_in_this_thread()) {
        // Waiting here could block the only thread able to run the strand.
        boost::asio::post(strand_, [self = shared_from_this()] {
            self->close_acceptor();
        });
        return;
    }

    std::promise<void> closed;
    auto done = closed.get_future();
    boost::asio::post(strand_, [this, &closed] {
        close_acceptor();
        closed.set_value();
    });
    done.wait();
}

void Listener::close_acceptor() {
    boost::system::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    if (ec) {
        log::warn("Listener: close failed: {}", ec.message());
    }
    log::info("listener stopped");
}

Listener::Tcp::endpoint Listener::local_endpoint() const {
    return acceptor_.local_endpoint();
}

void Listener::do_accept() {
    acceptor_.async_accept(
        boost::asio::make_strand(pool_.io_context()),
        [self = shared_from_this()](boost::system::error_code ec,
                                    Tcp::socket socket) {
            if (self->stopped_) {
                return;
            }

            if (ec) {
                log::warn("Listener: accept failed: {}", ec.message());
            } else {
                try {
                    auto session = self->session_factory_(std::move(socket));
                    session->run();
                } catch (const std::exception& e) {
                    log::error("Listener: session setup failed: {}", e.what());
                }
            }

            self->do_accept();
        }
    );
}

} // namespace segmux::infrastructure::net
