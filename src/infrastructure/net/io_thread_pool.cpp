#include "segmux/infrastructure/net/io_thread_pool.h"
#include "segmux/core/log.h"

#include <exception>
#include <stdexcept>

namespace segmux::infrastructure::net {

IoThreadPool::IoThreadPool(std::size_t thread_count)
    : io_context_(static_cast<int>(thread_count))
    , thread_count_(thread_count)
{
    if (thread_count == 0) {
        throw std::invalid_argument("IoThreadPool: thread count must be > 0");
    }
}

IoThreadPool::~IoThreadPool() {
    stop();
}

boost::asio::io_context& IoThreadPool::io_context() noexcept {
    return io_context_;
}

void IoThreadPool::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    if (io_context_.stopped()) {
        io_context_.restart();
    }
    work_guard_.emplace(io_context_.get_executor());

    threads_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this, i] { run_thread(i); });
    }

    log::info("io pool started with {} thread(s)", thread_count_);
}

void IoThreadPool::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    work_guard_.reset();
    io_context_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    log::info("io pool stopped");
}

bool IoThreadPool::running() const noexcept {
    return running_.load();
}

std::size_t IoThreadPool::thread_count() const noexcept {
    return thread_count_;
}

void IoThreadPool::run_thread(std::size_t index) {
    for (;;) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            log::error("io thread #{}: completion handler threw: {}", index, e.what());
        } catch (...) {
            log::error("io thread #{}: completion handler threw a non-standard exception", index);
        }
    }
}

} // namespace segmux::infrastructure::net
