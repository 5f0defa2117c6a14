#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "segmux/core/handlers.h"

namespace segmux::core {

// One segment boundary of the routing trie.
//
// A node exclusively owns its children. Fallback overrides are copied from
// the parent when a child is created; later changes to the parent are not
// seen by existing children.
class RouteNode {
public:
    // Registration sentinel for "any segment" and "any method".
    static constexpr const char* kWildcard = "*";

    RouteNode() = default;
    RouteNode(Handler not_found, Handler method_not_allowed);

    RouteNode(const RouteNode&) = delete;
    RouteNode& operator=(const RouteNode&) = delete;

    // --- children ---

    // Returns the child for `segment`, creating it if needed. The wildcard
    // sentinel selects the wildcard child.
    RouteNode& add_child(const std::string& segment);

    // Literal child lookup, nullptr if absent.
    const RouteNode* child(const std::string& segment) const;
    const RouteNode* wildcard_child() const noexcept;

    // --- method handlers ---

    // True once any handler was registered at this node.
    bool is_terminal() const noexcept;
    bool has_handler(const std::string& method) const;

    // Stores `handler` for `method` (or for any method with the wildcard
    // sentinel). Replaces an existing entry; duplicate detection is the
    // caller's job.
    void set_handler(const std::string& method, Handler handler);

    // Wildcard method handler first, then the literal method. nullptr when
    // neither is registered.
    const Handler* find_handler(const std::string& method) const;

    // --- fallbacks ---
    void set_not_found_handler(Handler handler);
    void set_method_not_allowed_handler(Handler handler);

    // Override if one is set, built-in default otherwise.
    const Handler& not_found_handler() const;
    const Handler& method_not_allowed_handler() const;

private:
    std::unordered_map<std::string, Handler> handlers_;
    Handler wildcard_handler_;
    std::unordered_map<std::string, std::unique_ptr<RouteNode>> children_;
    std::unique_ptr<RouteNode> wildcard_child_;

    Handler not_found_;
    Handler method_not_allowed_;
    bool terminal_ = false;
};

} // namespace segmux::core
