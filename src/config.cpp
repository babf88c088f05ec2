#include "config.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

namespace {

bool parse_unsigned(const std::string &text, unsigned long max, unsigned long &out) {
    if (text.empty())
        return false;
    char *end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || text[0] == '-' || value > max)
        return false;
    out = value;
    return true;
}

bool parse_port(const std::string &text, std::uint16_t &port) {
    unsigned long value = 0;
    if (!parse_unsigned(text, std::numeric_limits<std::uint16_t>::max(), value))
        return false;
    port = static_cast<std::uint16_t>(value);
    return true;
}

// Splits "host:port" into its parts; a bare host keeps the current port
bool parse_host_port(const std::string &text, std::string &host, std::uint16_t &port) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        host = text;
        return !host.empty();
    }
    host = text.substr(0, colon);
    return !host.empty() && parse_port(text.substr(colon + 1), port);
}

} // namespace

ArgsResult parse_server_args(int argc, const char *const *argv,
                             ServerConfig &config, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return ArgsResult::Help;

        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return ArgsResult::Invalid;
        }
        std::string value = argv[++i];
        unsigned long number = 0;

        if (arg == "--port") {
            if (!parse_port(value, config.port)) {
                error = "invalid port " + value;
                return ArgsResult::Invalid;
            }
        } else if (arg == "--bind") {
            config.bind_address = value;
        } else if (arg == "--tick-rate") {
            if (!parse_unsigned(value, 1000, number) || number == 0) {
                error = "invalid tick rate " + value;
                return ArgsResult::Invalid;
            }
            config.tick_rate = static_cast<unsigned>(number);
        } else if (arg == "--timeout-ms") {
            if (!parse_unsigned(value, std::numeric_limits<unsigned>::max(), number)) {
                error = "invalid timeout " + value;
                return ArgsResult::Invalid;
            }
            config.client_timeout_ms = static_cast<unsigned>(number);
        } else if (arg == "--keep-alive-ms") {
            if (!parse_unsigned(value, std::numeric_limits<unsigned>::max(), number)) {
                error = "invalid keep alive interval " + value;
                return ArgsResult::Invalid;
            }
            config.keep_alive_interval_ms = static_cast<unsigned>(number);
        } else if (arg == "--log-level") {
            auto level = parse_log_level(value);
            if (!level) {
                error = "invalid log level " + value;
                return ArgsResult::Invalid;
            }
            config.log_level = *level;
        } else {
            error = "unknown option " + arg;
            return ArgsResult::Invalid;
        }
    }
    return ArgsResult::Ok;
}

ArgsResult parse_client_args(int argc, const char *const *argv,
                             ClientConfig &config, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return ArgsResult::Help;

        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return ArgsResult::Invalid;
        }
        std::string value = argv[++i];
        unsigned long number = 0;

        if (arg == "--server") {
            if (!parse_host_port(value, config.server_address, config.server_port)) {
                error = "invalid server address " + value;
                return ArgsResult::Invalid;
            }
        } else if (arg == "--udp-port") {
            if (!parse_port(value, config.local_udp_port)) {
                error = "invalid port " + value;
                return ArgsResult::Invalid;
            }
        } else if (arg == "--tick-rate") {
            if (!parse_unsigned(value, 1000, number) || number == 0) {
                error = "invalid tick rate " + value;
                return ArgsResult::Invalid;
            }
            config.tick_rate = static_cast<unsigned>(number);
        } else if (arg == "--log-level") {
            auto level = parse_log_level(value);
            if (!level) {
                error = "invalid log level " + value;
                return ArgsResult::Invalid;
            }
            config.log_level = *level;
        } else {
            error = "unknown option " + arg;
            return ArgsResult::Invalid;
        }
    }
    return ArgsResult::Ok;
}

std::string server_usage(const std::string &program) {
    return "usage: " + program +
           " [--port PORT] [--bind ADDRESS] [--tick-rate HZ] [--timeout-ms MS]"
           " [--keep-alive-ms MS] [--log-level LEVEL]";
}

std::string client_usage(const std::string &program) {
    return "usage: " + program +
           " [--server HOST[:PORT]] [--udp-port PORT] [--tick-rate HZ]"
           " [--log-level LEVEL]";
}
