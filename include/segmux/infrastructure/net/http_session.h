#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <memory>

namespace segmux::core {
class HttpResponse;
class HttpRouter;
}

namespace segmux::infrastructure::net {

// One HTTP/1.1 connection. Reads requests, routes them through an
// HttpRouter and writes the responses until the peer closes or asks to.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using Tcp = boost::asio::ip::tcp;
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using RouterPtr = std::shared_ptr<const core::HttpRouter>;

    HttpSession(Tcp::socket socket, RouterPtr router);

    void run();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes);

    void handle_request(Request&& req);
    void prepare_response(const Request& req, const core::HttpResponse& response);

    void on_write(bool close,
                  boost::beast::error_code ec,
                  std::size_t bytes);

    void do_close();

private:
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    RouterPtr router_;
    Request request_;
    Response response_;
};

} // namespace segmux::infrastructure::net
