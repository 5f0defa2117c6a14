#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace segmux::core {

// Lexically cleans `path` into a rooted form: repeated slashes collapse,
// "." elements vanish, ".." removes the preceding element and there is no
// trailing slash except for "/" itself.
std::string clean_path(std::string_view path);

// Cleans `path` and splits off its first segment.
//
// Returns {head, tail} where head has no slashes and tail always starts
// with '/'. For "/" the head is empty and the tail is "/".
std::pair<std::string, std::string> shift_segment(std::string_view path);

} // namespace segmux::core
