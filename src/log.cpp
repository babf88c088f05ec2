#include "log.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> make_logger(const std::string &name,
                                            spdlog::level::level_enum level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string &name) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    return std::make_shared<spdlog::logger>(name, std::move(sink));
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) {
    if (text == "trace")
        return spdlog::level::trace;
    if (text == "debug")
        return spdlog::level::debug;
    if (text == "info")
        return spdlog::level::info;
    if (text == "warn" || text == "warning")
        return spdlog::level::warn;
    if (text == "error")
        return spdlog::level::err;
    if (text == "critical")
        return spdlog::level::critical;
    if (text == "off")
        return spdlog::level::off;
    return std::nullopt;
}

void shutdown_logging() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &logger) {
        logger->flush();
    });
    spdlog::shutdown();
}
