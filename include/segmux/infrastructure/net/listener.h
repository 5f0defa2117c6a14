#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <functional>
#include <memory>

namespace segmux::infrastructure::net {

class HttpSession;
class IoThreadPool;

class Listener : public std::enable_shared_from_this<Listener> {
public:
    using Tcp = boost::asio::ip::tcp;
    using SessionFactory =
        std::function<std::shared_ptr<HttpSession>(Tcp::socket)>;

    // Opens, binds and listens on `endpoint`. Throws std::runtime_error
    // naming the step that failed.
    Listener(
        IoThreadPool& pool,
        const Tcp::endpoint& endpoint,
        SessionFactory session_factory
    );

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Accept loop; each connection gets its own strand.
    void run();

    // Stops accepting. The acceptor is closed on its strand before this
    // returns, so it must be called before the pool is stopped. From an I/O
    // thread the close is only queued. Sessions already running finish on
    // their own.
    void stop();

    // Bound address, useful when listening on port 0.
    Tcp::endpoint local_endpoint() const;

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    void do_accept();
    void close_acceptor();

    IoThreadPool& pool_;
    Strand strand_;
    Tcp::acceptor acceptor_;
    SessionFactory session_factory_;
    std::atomic<bool> stopped_{false};
};

} // namespace segmux::infrastructure::net
