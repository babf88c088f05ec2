#pragma once

#include "id.hpp"
#include "net_types.hpp"
#include "wire_format.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Routing key for one RPC handler, see rpc.hpp
using FunctionId = std::uint64_t;

// Messages a client sends to the server
namespace client_msg {

struct Login {
  void encode(WireWriter &) const {}
  static Login decode(WireReader &) { return {}; }
  friend bool operator==(const Login &, const Login &) { return true; }
};

struct Logout {
  void encode(WireWriter &) const {}
  static Logout decode(WireReader &) { return {}; }
  friend bool operator==(const Logout &, const Logout &) { return true; }
};

struct Ping {
  std::string text;

  void encode(WireWriter &writer) const;
  static Ping decode(WireReader &reader);
  friend bool operator==(const Ping &a, const Ping &b) { return a.text == b.text; }
};

struct Pong {
  std::string text;

  void encode(WireWriter &writer) const;
  static Pong decode(WireReader &reader);
  friend bool operator==(const Pong &a, const Pong &b) { return a.text == b.text; }
};

struct RawData {
  std::vector<std::uint8_t> bytes;

  void encode(WireWriter &writer) const;
  static RawData decode(WireReader &reader);
  friend bool operator==(const RawData &a, const RawData &b) {
    return a.bytes == b.bytes;
  }
};

struct ModMessage {
  entity_id entity;
  FunctionId function = 0;
  std::vector<std::uint8_t> payload;

  void encode(WireWriter &writer) const;
  static ModMessage decode(WireReader &reader);
  friend bool operator==(const ModMessage &a, const ModMessage &b) {
    return a.entity == b.entity && a.function == b.function &&
           a.payload == b.payload;
  }
};

struct Register {
  std::string client_version;

  void encode(WireWriter &writer) const;
  static Register decode(WireReader &reader);
  friend bool operator==(const Register &a, const Register &b) {
    return a.client_version == b.client_version;
  }
};

struct Acknowledge {
  conv_id conversation;

  void encode(WireWriter &writer) const;
  static Acknowledge decode(WireReader &reader);
  friend bool operator==(const Acknowledge &a, const Acknowledge &b) {
    return a.conversation == b.conversation;
  }
};

} // namespace client_msg

using ClientMessage =
    std::variant<client_msg::Login, client_msg::Logout, client_msg::Ping,
                 client_msg::Pong, client_msg::RawData, client_msg::ModMessage,
                 client_msg::Register, client_msg::Acknowledge>;

struct ClientPacket {
  client_id client;
  conv_id conversation;
  ClientMessage message;

  void encode(WireWriter &writer) const;
  static ClientPacket decode(WireReader &reader);
  friend bool operator==(const ClientPacket &a, const ClientPacket &b) {
    return a.client == b.client && a.conversation == b.conversation &&
           a.message == b.message;
  }
};

// Mod entry advertised in ServerInfo: (name, flags, archive hash, size)
struct ModInfo {
  std::string name;
  std::vector<std::string> flags;
  std::string hash;
  std::uint64_t size = 0;

  void encode(WireWriter &writer) const;
  static ModInfo decode(WireReader &reader);
  friend bool operator==(const ModInfo &a, const ModInfo &b) {
    return a.name == b.name && a.flags == b.flags && a.hash == b.hash &&
           a.size == b.size;
  }
};

struct ServerInfo {
  std::string server_version;
  std::string mod_profile;
  std::string mod_version;
  std::vector<ModInfo> mods;

  void encode(WireWriter &writer) const;
  static ServerInfo decode(WireReader &reader);
  friend bool operator==(const ServerInfo &a, const ServerInfo &b) {
    return a.server_version == b.server_version &&
           a.mod_profile == b.mod_profile && a.mod_version == b.mod_version &&
           a.mods == b.mods;
  }
};

// Messages the server sends to a client
namespace server_msg {

struct KeepAlive {
  void encode(WireWriter &) const {}
  static KeepAlive decode(WireReader &) { return {}; }
  friend bool operator==(const KeepAlive &, const KeepAlive &) { return true; }
};

struct Acknowledge {
  conv_id conversation;

  void encode(WireWriter &writer) const;
  static Acknowledge decode(WireReader &reader);
  friend bool operator==(const Acknowledge &a, const Acknowledge &b) {
    return a.conversation == b.conversation;
  }
};

struct Unregister {
  std::string reason;

  void encode(WireWriter &writer) const;
  static Unregister decode(WireReader &reader);
  friend bool operator==(const Unregister &a, const Unregister &b) {
    return a.reason == b.reason;
  }
};

struct RegisterResponse {
  // ServerInfo on success, the refusal reason otherwise
  std::variant<ServerInfo, std::string> result;

  void encode(WireWriter &writer) const;
  static RegisterResponse decode(WireReader &reader);
  friend bool operator==(const RegisterResponse &a, const RegisterResponse &b) {
    return a.result == b.result;
  }
};

struct Kick {
  std::string reason;

  void encode(WireWriter &writer) const;
  static Kick decode(WireReader &reader);
  friend bool operator==(const Kick &a, const Kick &b) { return a.reason == b.reason; }
};

struct Login {
  client_id client;
  std::string name;

  void encode(WireWriter &writer) const;
  static Login decode(WireReader &reader);
  friend bool operator==(const Login &a, const Login &b) {
    return a.client == b.client && a.name == b.name;
  }
};

struct Logout {
  client_id client;
  std::string name;

  void encode(WireWriter &writer) const;
  static Logout decode(WireReader &reader);
  friend bool operator==(const Logout &a, const Logout &b) {
    return a.client == b.client && a.name == b.name;
  }
};

using Ping = client_msg::Ping;
using Pong = client_msg::Pong;
using RawData = client_msg::RawData;
using ModMessage = client_msg::ModMessage;

struct AddClientHandle {
  entity_id entity;
  handle_type_id handle_type;

  void encode(WireWriter &writer) const;
  static AddClientHandle decode(WireReader &reader);
  friend bool operator==(const AddClientHandle &a, const AddClientHandle &b) {
    return a.entity == b.entity && a.handle_type == b.handle_type;
  }
};

struct RemoveClientHandle {
  entity_id entity;

  void encode(WireWriter &writer) const;
  static RemoveClientHandle decode(WireReader &reader);
  friend bool operator==(const RemoveClientHandle &a,
                         const RemoveClientHandle &b) {
    return a.entity == b.entity;
  }
};

} // namespace server_msg

using ServerMessage =
    std::variant<server_msg::KeepAlive, server_msg::Acknowledge,
                 server_msg::Unregister, server_msg::RegisterResponse,
                 server_msg::Kick, server_msg::Login, server_msg::Logout,
                 server_msg::Ping, server_msg::Pong, server_msg::RawData,
                 server_msg::ModMessage, server_msg::AddClientHandle,
                 server_msg::RemoveClientHandle>;

struct ServerPacket {
  conv_id conversation;
  ServerMessage message;

  void encode(WireWriter &writer) const;
  static ServerPacket decode(WireReader &reader);
  friend bool operator==(const ServerPacket &a, const ServerPacket &b) {
    return a.conversation == b.conversation && a.message == b.message;
  }
};

// Build a packet with a fresh conversation id
ClientPacket make_client_packet(const client_id &client, ClientMessage message);
ServerPacket make_server_packet(ServerMessage message);

// Short name of the message kind, for logs
const char *message_name(const ClientMessage &message);
const char *message_name(const ServerMessage &message);
