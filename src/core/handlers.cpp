#include "segmux/core/handlers.h"
#include "segmux/core/http_response.h"

namespace segmux::core {

const Handler& not_found_handler() {
    static const Handler handler = [](HttpRequest&, HttpResponse& response, RequestContext&) {
        response.set_error(404, "404 page not found");
    };
    return handler;
}

const Handler& method_not_allowed_handler() {
    static const Handler handler = [](HttpRequest&, HttpResponse& response, RequestContext&) {
        response.set_error(405, "405 method not allowed");
    };
    return handler;
}

} // namespace segmux::core
