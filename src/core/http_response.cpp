#include "segmux/core/http_response.h"

namespace segmux::core {

HttpResponse::HttpResponse()
    : status_(200) {}

int HttpResponse::status() const noexcept {
    return status_;
}

void HttpResponse::set_status(int status) {
    status_ = status;
}

const HttpResponse::Headers& HttpResponse::headers() const noexcept {
    return headers_;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers_.find(name);
    return it != headers_.end() ? it->second : std::string{};
}

void HttpResponse::set_header(std::string name, std::string value) {
    headers_[std::move(name)] = std::move(value);
}

const std::string& HttpResponse::body() const noexcept {
    return body_;
}

void HttpResponse::set_body(std::string body) {
    body_ = std::move(body);
}

void HttpResponse::set_json(std::string json_body) {
    set_header("Content-Type", "application/json");
    set_body(std::move(json_body));
}

void HttpResponse::set_text(std::string text_body) {
    set_header("Content-Type", "text/plain");
    set_body(std::move(text_body));
}

void HttpResponse::set_error(int status, std::string message) {
    set_status(status);
    set_header("Content-Type", "text/plain; charset=utf-8");
    set_header("X-Content-Type-Options", "nosniff");
    message.push_back('\n');
    set_body(std::move(message));
}

} // namespace segmux::core
