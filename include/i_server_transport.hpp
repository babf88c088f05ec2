#pragma once

#include "id.hpp"
#include "net_types.hpp"
#include "packets.hpp"
#include <variant>
#include <vector>

// A packet as it came off the wire, with the channel it arrived on
struct ReceivedPacket {
  ClientPacket packet;
  SendMode channel = SendMode::Safe;
  Endpoint source;
};

using ServerInboxEntry = std::variant<ReceivedPacket, ConnectionEvent>;

// Server side of the transport as seen by the session loop and the
// messenger modules
class i_server_transport {
public:
  virtual ~i_server_transport() = default;

  // Everything received since the previous drain; never blocks
  virtual std::vector<ServerInboxEntry> drain() = 0;

  virtual bool register_client(const client_id &client) = 0;
  virtual bool remove_client(const client_id &client) = 0;
  virtual bool has_client(const client_id &client) const = 0;
  virtual std::vector<client_id> client_ids() const = 0;

  virtual SendResult send(const client_id &client, const ServerPacket &packet,
                          SendMode mode) = 0;
};
