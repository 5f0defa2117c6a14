#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace segmux::core {

class HttpRequest {
public:
    using Headers = std::unordered_map<std::string, std::string>;
    using QueryParams = std::unordered_map<std::string, std::string>;

    HttpRequest() = default;
    HttpRequest(std::string method, std::string path);

    // --- method / path ---
    const std::string& method() const noexcept;
    const std::string& path() const noexcept;

    void set_method(std::string method);
    void set_path(std::string path);

    // --- headers ---
    const Headers& headers() const noexcept;
    bool has_header(std::string_view name) const;
    std::string header(std::string_view name) const;

    void set_header(std::string name, std::string value);

    // Like set_header, but a repeated field keeps every value: they are
    // joined with "; " for Cookie (any case) and with ", " otherwise.
    void add_header(std::string name, std::string value);

    // --- query params ---
    const QueryParams& query_params() const noexcept;
    std::string query_param(std::string_view key) const;
    void set_query_param(std::string key, std::string value);

    // Splits "path?a=1&b" into the path and its query parameters.
    void set_target(std::string_view target);

    // --- body ---
    const std::string& body() const noexcept;
    void set_body(std::string body);

private:
    std::string method_;
    std::string path_;
    Headers headers_;
    QueryParams query_params_;
    std::string body_;
};

} // namespace segmux::core
