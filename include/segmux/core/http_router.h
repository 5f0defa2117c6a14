#pragma once

#include <string>

#include "segmux/core/handlers.h"
#include "segmux/core/request_context.h"
#include "segmux/core/route_node.h"

namespace segmux::core {

class HttpRequest;
class HttpResponse;

enum class RouteStatus {
    matched,
    not_found,
    method_not_allowed
};

const char* to_string(RouteStatus status) noexcept;

struct RouteMatch {
    // Never null once returned by HttpRouter::match.
    const Handler* handler = nullptr;
    RouteStatus status = RouteStatus::not_found;
    PathParameters path_parameters;
};

// Trie based request router.
//
// Patterns are '/'-separated; a "*" segment matches any single segment and
// records it as a path parameter, a "*" method matches every method. At a
// node with a wildcard child, the wildcard wins over literal children, and
// a wildcard method handler wins over literal method handlers.
//
// Registration must complete before the router is shared between threads;
// match() and route() are read-only afterwards.
class HttpRouter {
public:
    using Handler = core::Handler;

    HttpRouter() = default;

    HttpRouter(const HttpRouter&) = delete;
    HttpRouter& operator=(const HttpRouter&) = delete;

    // Throws DuplicateRouteError if `pattern` already has a handler for
    // `method`, std::invalid_argument if `handler` is empty. The router is
    // left untouched on failure.
    void add_route(
        const std::string& method,
        const std::string& pattern,
        Handler handler
    );

    // Fallbacks for the root. Nodes created by later add_route calls copy
    // them; nodes that already exist keep what they copied.
    void set_not_found_handler(Handler handler);
    void set_method_not_allowed_handler(Handler handler);

    RouteMatch match(
        const std::string& method,
        const std::string& path
    ) const;

    // Matches the request, stores the captured path parameters in
    // `context` and invokes the resolved handler.
    RouteStatus route(
        HttpRequest& request,
        HttpResponse& response,
        RequestContext& context
    ) const;

private:
    RouteNode root_;
};

} // namespace segmux::core
