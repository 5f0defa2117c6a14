#include "segmux/core/route_error.h"

namespace segmux::core {

DuplicateRouteError::DuplicateRouteError(const std::string& pattern, const std::string& method)
    : std::logic_error("duplicate route: " + method + " " + pattern)
    , pattern_(pattern)
    , method_(method) {}

const std::string& DuplicateRouteError::pattern() const noexcept {
    return pattern_;
}

const std::string& DuplicateRouteError::method() const noexcept {
    return method_;
}

} // namespace segmux::core
