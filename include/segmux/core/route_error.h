#pragma once

#include <stdexcept>
#include <string>

namespace segmux::core {

// Thrown by HttpRouter::add_route when the pattern and method already
// have a handler.
class DuplicateRouteError : public std::logic_error {
public:
    DuplicateRouteError(const std::string& pattern, const std::string& method);

    const std::string& pattern() const noexcept;
    const std::string& method() const noexcept;

private:
    std::string pattern_;
    std::string method_;
};

} // namespace segmux::core
