#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace segmux::infrastructure::net {

// One io_context shared by a fixed number of threads.
//
// An exception escaping a completion handler is logged and the thread goes
// back into run(), so one failing connection never takes a thread down.
class IoThreadPool {
public:
    explicit IoThreadPool(std::size_t thread_count);
    ~IoThreadPool();

    IoThreadPool(const IoThreadPool&) = delete;
    IoThreadPool& operator=(const IoThreadPool&) = delete;

    boost::asio::io_context& io_context() noexcept;

    // Both are idempotent. stop() abandons pending work and joins.
    void start();
    void stop();

    bool running() const noexcept;
    std::size_t thread_count() const noexcept;

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void run_thread(std::size_t index);

    boost::asio::io_context io_context_;
    std::optional<WorkGuard> work_guard_;
    std::size_t thread_count_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

} // namespace segmux::infrastructure::net
