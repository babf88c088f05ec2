#pragma once

#include "net_types.hpp"
#include "packets.hpp"
#include <variant>
#include <vector>

using ClientInboxEntry = std::variant<ServerPacket, ConnectionEvent>;

class i_client_transport {
public:
  virtual ~i_client_transport() = default;

  virtual std::vector<ClientInboxEntry> drain() = 0;
  virtual SendResult send(const ClientPacket &packet, SendMode mode) = 0;
  virtual ConnectionState state() const = 0;
};
