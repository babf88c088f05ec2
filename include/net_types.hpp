#pragma once

#include "id.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

// Largest encoded datagram accepted by a quick (unreliable) send
constexpr std::size_t MAX_PACKET_SIZE = 16384;
// Largest frame the reliable stream reader accepts before treating the
// stream as corrupt
constexpr std::size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;
// Size of the little-endian length prefix in front of every frame
constexpr std::size_t FRAME_HEADER_SIZE = 4;

enum class SendMode : std::uint8_t {
  Quick, // datagram, best effort, unordered
  Safe   // stream, reliable, ordered
};

enum class SendResult : std::uint8_t {
  Ok,
  TooLarge,
  UnknownClient,
  NotConnected,
  QueueFull,
  IoError
};

const char *to_string(SendMode mode);
const char *to_string(SendResult result);

// IPv4 address + port, host byte order
struct Endpoint {
  std::uint32_t address = 0;
  std::uint16_t port = 0;

  bool is_valid() const { return port != 0; }
  std::string to_string() const;

  friend bool operator==(const Endpoint &a, const Endpoint &b) {
    return a.address == b.address && a.port == b.port;
  }
  friend bool operator!=(const Endpoint &a, const Endpoint &b) {
    return !(a == b);
  }
};

enum class ConnectionState : std::uint8_t { Connecting, Connected, Disconnected };

const char *to_string(ConnectionState state);

// Raised by the transport threads when a reliable connection changes
// state. peer is the client on the server side, nil on the client side.
struct ConnectionEvent {
  Id peer;
  ConnectionState state = ConnectionState::Disconnected;
  std::string reason;
};
