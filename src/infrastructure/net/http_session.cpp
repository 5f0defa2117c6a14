#include "segmux/infrastructure/net/http_session.h"
#include "segmux/core/http_request.h"
#include "segmux/core/http_response.h"
#include "segmux/core/http_router.h"
#include "segmux/core/log.h"
#include "segmux/core/request_context.h"

#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace segmux::infrastructure::net {

namespace http = boost::beast::http;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

// Range Beast accepts for a status code.
constexpr int kMinStatus = 100;
constexpr int kMaxStatus = 999;

std::string to_std_string(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

std::string next_request_id() {
    static std::atomic<std::uint64_t> counter{0};
    return std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1);
}

core::HttpRequest to_core_request(const HttpSession::Request& req) {
    core::HttpRequest request;
    request.set_method(to_std_string(req.method_string()));
    request.set_target(to_std_string(req.target()));
    for (const auto& field : req) {
        request.add_header(to_std_string(field.name_string()), to_std_string(field.value()));
    }
    request.set_body(req.body());
    return request;
}

core::HttpResponse internal_error() {
    core::HttpResponse response;
    response.set_error(500, "500 internal server error");
    return response;
}

} // namespace

HttpSession::HttpSession(Tcp::socket socket, RouterPtr router)
    : stream_(std::move(socket))
    , router_(std::move(router)) {}

void HttpSession::run() {
    // Start on the session's strand.
    boost::asio::dispatch(
        stream_.get_executor(),
        boost::beast::bind_front_handler(
            &HttpSession::do_read,
            shared_from_this()));
}

void HttpSession::do_read() {
    request_ = {};
    stream_.expires_after(kReadTimeout);

    http::async_read(
        stream_,
        buffer_,
        request_,
        boost::beast::bind_front_handler(
            &HttpSession::on_read,
            shared_from_this()));
}

void HttpSession::on_read(boost::beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }

    if (ec) {
        if (ec != boost::beast::error::timeout) {
            log::warn("HttpSession: read error: {}", ec.message());
        }
        return;
    }

    handle_request(std::move(request_));
}

void HttpSession::handle_request(Request&& req) {
    core::RequestContext context;
    context.set_request_id(next_request_id());

    try {
        auto request = to_core_request(req);
        core::HttpResponse response;
        const auto status = router_->route(request, response, context);

        if (response.status() < kMinStatus || response.status() > kMaxStatus) {
            log::error("[{}] handler for {} {} set invalid status {}", context.request_id(),
                       request.method(), request.path(), response.status());
            response = internal_error();
        }

        log::debug("[{}] {} {} -> {} ({})", context.request_id(), request.method(),
                   request.path(), response.status(), core::to_string(status));
        prepare_response(req, response);
    } catch (const std::exception& e) {
        log::error("[{}] {} {} failed: {}", context.request_id(),
                   to_std_string(req.method_string()), to_std_string(req.target()), e.what());
        prepare_response(req, internal_error());
    } catch (...) {
        log::error("[{}] {} {} failed with a non-standard exception", context.request_id(),
                   to_std_string(req.method_string()), to_std_string(req.target()));
        prepare_response(req, internal_error());
    }

    auto close = response_.need_eof();

    http::async_write(
        stream_,
        response_,
        boost::beast::bind_front_handler(
            &HttpSession::on_write,
            shared_from_this(),
            close));
}

void HttpSession::prepare_response(const Request& req, const core::HttpResponse& response) {
    response_ = {};
    response_.version(req.version());
    response_.keep_alive(req.keep_alive());
    response_.result(static_cast<unsigned>(response.status()));
    response_.set(http::field::server, "segmux");
    for (const auto& [name, value] : response.headers()) {
        response_.set(name, value);
    }
    response_.body() = response.body();
    response_.prepare_payload();
}

void HttpSession::on_write(bool close,
                           boost::beast::error_code ec,
                           std::size_t) {
    if (ec) {
        log::warn("HttpSession: write error: {}", ec.message());
        return;
    }

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    boost::beast::error_code ec;
    stream_.socket().shutdown(Tcp::socket::shutdown_send, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        log::debug("HttpSession: shutdown: {}", ec.message());
    }
}

} // namespace segmux::infrastructure::net
