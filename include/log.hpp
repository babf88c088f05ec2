#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

// Loggers are created once at start-up and handed to each component;
// nothing in the library logs through the spdlog default logger.
std::shared_ptr<spdlog::logger>
make_logger(const std::string &name,
            spdlog::level::level_enum level = spdlog::level::info);

// Logger that discards everything (tests, tools)
std::shared_ptr<spdlog::logger> make_null_logger(const std::string &name);

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

// Flush and drop every registered logger
void shutdown_logging();
