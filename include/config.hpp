#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <spdlog/common.h>

struct ServerConfig {
  std::string bind_address = "0.0.0.0";
  std::uint16_t port = 6090;
  unsigned tick_rate = 20;
  unsigned client_timeout_ms = 10000;
  unsigned keep_alive_interval_ms = 2000;
  std::size_t outbound_queue_limit = 1024;
  std::string server_version = "0.1.0";
  spdlog::level::level_enum log_level = spdlog::level::info;
};

struct ClientConfig {
  std::string server_address = "127.0.0.1";
  std::uint16_t server_port = 6090;
  std::uint16_t local_udp_port = 0; // 0 = any free port
  unsigned tick_rate = 60;
  unsigned connect_timeout_ms = 3000;
  std::size_t outbound_queue_limit = 1024;
  std::string client_version = "0.1.0";
  spdlog::level::level_enum log_level = spdlog::level::info;
};

enum class ArgsResult { Ok, Help, Invalid };

// Command line parsing. On Invalid, error describes the offending option.
ArgsResult parse_server_args(int argc, const char *const *argv,
                             ServerConfig &config, std::string &error);
ArgsResult parse_client_args(int argc, const char *const *argv,
                             ClientConfig &config, std::string &error);

std::string server_usage(const std::string &program);
std::string client_usage(const std::string &program);
