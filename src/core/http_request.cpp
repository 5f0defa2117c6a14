#include "segmux/core/http_request.h"

#include <algorithm>
#include <cctype>

namespace segmux::core {

namespace {

bool is_cookie(std::string_view name) {
    constexpr std::string_view cookie = "cookie";
    return std::equal(name.begin(), name.end(), cookie.begin(), cookie.end(),
                      [](unsigned char a, unsigned char b) { return std::tolower(a) == b; });
}

} // namespace

HttpRequest::HttpRequest(std::string method, std::string path)
    : method_(std::move(method))
    , path_(std::move(path)) {}

const std::string& HttpRequest::method() const noexcept {
    return method_;
}

const std::string& HttpRequest::path() const noexcept {
    return path_;
}

void HttpRequest::set_method(std::string method) {
    method_ = std::move(method);
}

void HttpRequest::set_path(std::string path) {
    path_ = std::move(path);
}

const HttpRequest::Headers& HttpRequest::headers() const noexcept {
    return headers_;
}

bool HttpRequest::has_header(std::string_view name) const {
    return headers_.find(std::string(name)) != headers_.end();
}

std::string HttpRequest::header(std::string_view name) const {
    auto it = headers_.find(std::string(name));
    return it != headers_.end() ? it->second : std::string{};
}

void HttpRequest::set_header(std::string name, std::string value) {
    headers_[std::move(name)] = std::move(value);
}

void HttpRequest::add_header(std::string name, std::string value) {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
        headers_.emplace(std::move(name), std::move(value));
        return;
    }

    it->second.append(is_cookie(name) ? "; " : ", ");
    it->second.append(value);
}

const HttpRequest::QueryParams& HttpRequest::query_params() const noexcept {
    return query_params_;
}

std::string HttpRequest::query_param(std::string_view key) const {
    auto it = query_params_.find(std::string(key));
    return it != query_params_.end() ? it->second : std::string{};
}

void HttpRequest::set_query_param(std::string key, std::string value) {
    query_params_[std::move(key)] = std::move(value);
}

void HttpRequest::set_target(std::string_view target) {
    const auto question = target.find('?');
    path_ = std::string(target.substr(0, question));
    if (question == std::string_view::npos) {
        return;
    }

    auto query = target.substr(question + 1);
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }

        const auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            set_query_param(std::string(pair), std::string{});
        } else {
            set_query_param(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
        }
    }
}

const std::string& HttpRequest::body() const noexcept {
    return body_;
}

void HttpRequest::set_body(std::string body) {
    body_ = std::move(body);
}

} // namespace segmux::core
