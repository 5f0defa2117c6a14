#include "segmux/app/server_config.h"

#include <boost/function.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <thread>

namespace po = boost::program_options;

namespace segmux::app {

namespace {

constexpr long kMaxPort = 65535;
constexpr long kMaxThreads = 1024;

long default_threads() {
    const auto hardware = static_cast<long>(std::thread::hardware_concurrency());
    return std::clamp<long>(hardware, 1, kMaxThreads);
}

} // namespace

std::string env_mapper(const std::string& env_var) {
    std::string name = env_var;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (name == "SEGMUX_ADDRESS") return "address";
    if (name == "SEGMUX_PORT") return "port";
    if (name == "SEGMUX_THREADS") return "threads";
    if (name == "SEGMUX_LOG_LEVEL") return "log-level";
    return "";
}

bool ServerConfig::init_from(int argc, const char* const argv[], std::ostream& out) {
    // Parsed signed so that "-1" is rejected instead of wrapping around.
    long port_arg = port;
    long threads_arg = default_threads();

    po::options_description config("configuration");
    config.add_options()
        ("help,h", "print usage message")
        ("address,a", po::value<std::string>(&address)->default_value(address), "listen address, env: SEGMUX_ADDRESS")
        ("port,p", po::value<long>(&port_arg)->default_value(port_arg), "listen port, env: SEGMUX_PORT")
        ("threads,t", po::value<long>(&threads_arg)->default_value(threads_arg), "io threads, env: SEGMUX_THREADS")
        ("log-level,l", po::value<std::string>(&log_level)->default_value(log_level), "trace|debug|info|warn|error|critical|off, env: SEGMUX_LOG_LEVEL")
        ;

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, config), vm);
    po::store(po::parse_environment(config, boost::function1<std::string, std::string>(env_mapper)), vm);
    po::notify(vm);

    if (vm.count("help")) {
        out << "segmux demo server\n" << config << "\n";
        return false;
    }

    if (port_arg < 0 || port_arg > kMaxPort) {
        throw std::invalid_argument("port out of range: " + std::to_string(port_arg));
    }

    if (threads_arg < 1 || threads_arg > kMaxThreads) {
        throw std::invalid_argument("threads must be in 1.." + std::to_string(kMaxThreads)
                                    + ": " + std::to_string(threads_arg));
    }

    if (log_level != "off" && spdlog::level::from_str(log_level) == spdlog::level::off) {
        throw std::invalid_argument("unknown log level: " + log_level);
    }

    port = static_cast<std::uint16_t>(port_arg);
    threads = static_cast<std::size_t>(threads_arg);
    return true;
}

spdlog::level::level_enum ServerConfig::level() const {
    return spdlog::level::from_str(log_level);
}

} // namespace segmux::app
