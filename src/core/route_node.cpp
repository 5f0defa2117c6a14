#include "segmux/core/route_node.h"

namespace segmux::core {

RouteNode::RouteNode(Handler not_found, Handler method_not_allowed)
    : not_found_(std::move(not_found))
    , method_not_allowed_(std::move(method_not_allowed)) {}

RouteNode& RouteNode::add_child(const std::string& segment) {
    if (segment == kWildcard) {
        if (!wildcard_child_) {
            wildcard_child_ = std::make_unique<RouteNode>(not_found_, method_not_allowed_);
        }
        return *wildcard_child_;
    }

    auto& slot = children_[segment];
    if (!slot) {
        slot = std::make_unique<RouteNode>(not_found_, method_not_allowed_);
    }
    return *slot;
}

const RouteNode* RouteNode::child(const std::string& segment) const {
    const auto it = children_.find(segment);
    return it != children_.end() ? it->second.get() : nullptr;
}

const RouteNode* RouteNode::wildcard_child() const noexcept {
    return wildcard_child_.get();
}

bool RouteNode::is_terminal() const noexcept {
    return terminal_;
}

bool RouteNode::has_handler(const std::string& method) const {
    if (method == kWildcard) {
        return static_cast<bool>(wildcard_handler_);
    }
    return handlers_.find(method) != handlers_.end();
}

void RouteNode::set_handler(const std::string& method, Handler handler) {
    terminal_ = true;
    if (method == kWildcard) {
        wildcard_handler_ = std::move(handler);
        return;
    }
    handlers_[method] = std::move(handler);
}

const Handler* RouteNode::find_handler(const std::string& method) const {
    if (wildcard_handler_) {
        return &wildcard_handler_;
    }

    const auto it = handlers_.find(method);
    return it != handlers_.end() ? &it->second : nullptr;
}

void RouteNode::set_not_found_handler(Handler handler) {
    not_found_ = std::move(handler);
}

void RouteNode::set_method_not_allowed_handler(Handler handler) {
    method_not_allowed_ = std::move(handler);
}

const Handler& RouteNode::not_found_handler() const {
    return not_found_ ? not_found_ : core::not_found_handler();
}

const Handler& RouteNode::method_not_allowed_handler() const {
    return method_not_allowed_ ? method_not_allowed_ : core::method_not_allowed_handler();
}

} // namespace segmux::core
