#include "segmux/core/path.h"

#include <vector>

namespace segmux::core {

std::string clean_path(std::string_view path) {
    std::vector<std::string_view> elements;

    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }

        const auto element = path.substr(pos, next - pos);
        if (element == "..") {
            // ".." at the root stays at the root
            if (!elements.empty()) {
                elements.pop_back();
            }
        } else if (!element.empty() && element != ".") {
            elements.push_back(element);
        }

        pos = next + 1;
    }

    if (elements.empty()) {
        return "/";
    }

    std::string cleaned;
    cleaned.reserve(path.size() + 1);
    for (const auto element : elements) {
        cleaned.push_back('/');
        cleaned.append(element);
    }
    return cleaned;
}

std::pair<std::string, std::string> shift_segment(std::string_view path) {
    const auto cleaned = clean_path(path);

    const auto slash = cleaned.find('/', 1);
    if (slash == std::string::npos) {
        return {cleaned.substr(1), "/"};
    }
    return {cleaned.substr(1, slash - 1), cleaned.substr(slash)};
}

} // namespace segmux::core
