#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace segmux::app {

// Settings of the demo server. Read from the command line first and from
// SEGMUX_* environment variables second; the command line wins.
struct ServerConfig {

    std::string address   = "0.0.0.0";
    std::uint16_t port    = 8080;
    std::size_t threads   = 1;
    std::string log_level = "info";

    // Returns false when only help was requested (usage is written to
    // `out`). Throws boost::program_options::error on malformed input and
    // std::invalid_argument on out-of-range values.
    bool init_from(int argc, const char* const argv[], std::ostream& out);

    spdlog::level::level_enum level() const;
};

// Maps SEGMUX_* environment variables onto option names.
std::string env_mapper(const std::string& env_var);

} // namespace segmux::app
