#pragma once

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

namespace segmux {

namespace log = spdlog;

} // namespace segmux
