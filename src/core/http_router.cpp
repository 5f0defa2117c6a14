#include "segmux/core/http_router.h"
#include "segmux/core/http_request.h"
#include "segmux/core/http_response.h"
#include "segmux/core/log.h"
#include "segmux/core/path.h"
#include "segmux/core/route_error.h"

#include <stdexcept>
#include <tuple>

namespace segmux::core {

const char* to_string(RouteStatus status) noexcept {
    switch (status) {
    case RouteStatus::matched:
        return "matched";
    case RouteStatus::not_found:
        return "not found";
    case RouteStatus::method_not_allowed:
        return "method not allowed";
    }
    return "unknown";
}

void HttpRouter::add_route(
    const std::string& method,
    const std::string& pattern,
    Handler handler
) {
    if (!handler) {
        throw std::invalid_argument("HttpRouter: empty handler for " + method + " " + pattern);
    }

    RouteNode* node = &root_;
    auto [head, tail] = shift_segment(pattern);
    while (!head.empty()) {
        node = &node->add_child(head);
        std::tie(head, tail) = shift_segment(tail);
    }

    // A duplicate implies every node on the path already existed, so
    // nothing was created above.
    if (node->has_handler(method)) {
        throw DuplicateRouteError(pattern, method);
    }

    node->set_handler(method, std::move(handler));
    log::debug("registered route {} {}", method, clean_path(pattern));
}

void HttpRouter::set_not_found_handler(Handler handler) {
    root_.set_not_found_handler(std::move(handler));
}

void HttpRouter::set_method_not_allowed_handler(Handler handler) {
    root_.set_method_not_allowed_handler(std::move(handler));
}

RouteMatch HttpRouter::match(
    const std::string& method,
    const std::string& path
) const {
    RouteMatch result;

    const RouteNode* node = &root_;
    auto [head, tail] = shift_segment(path);
    while (!head.empty()) {
        if (const auto* wildcard = node->wildcard_child()) {
            result.path_parameters.push_back(std::move(head));
            node = wildcard;
        } else {
            const auto* next = node->child(head);
            if (next == nullptr) {
                result.handler = &node->not_found_handler();
                result.status = RouteStatus::not_found;
                return result;
            }
            node = next;
        }
        std::tie(head, tail) = shift_segment(tail);
    }

    if (!node->is_terminal()) {
        result.handler = &node->not_found_handler();
        result.status = RouteStatus::not_found;
        return result;
    }

    if (const auto* handler = node->find_handler(method)) {
        result.handler = handler;
        result.status = RouteStatus::matched;
        return result;
    }

    result.handler = &node->method_not_allowed_handler();
    result.status = RouteStatus::method_not_allowed;
    return result;
}

RouteStatus HttpRouter::route(
    HttpRequest& request,
    HttpResponse& response,
    RequestContext& context
) const {
    auto result = match(request.method(), request.path());
    if (result.status != RouteStatus::matched) {
        log::debug("{} {}: {}", request.method(), request.path(), to_string(result.status));
    }

    context.set<PathParameters>(kPathParametersKey, std::move(result.path_parameters));
    (*result.handler)(request, response, context);
    return result.status;
}

} // namespace segmux::core
