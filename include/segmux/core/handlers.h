#pragma once

#include <functional>

namespace segmux::core {

class HttpRequest;
class HttpResponse;
class RequestContext;

using Handler = std::function<void(
    HttpRequest&,
    HttpResponse&,
    RequestContext&
)>;

// Replies "404 page not found" with status 404.
const Handler& not_found_handler();

// Replies "405 method not allowed" with status 405.
const Handler& method_not_allowed_handler();

} // namespace segmux::core
