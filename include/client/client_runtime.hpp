#pragma once

#include "client/client_messenger.hpp"
#include "client/data_store.hpp"
#include "client/i_client_handle.hpp"
#include "i_client_transport.hpp"
#include "id.hpp"
#include "net_types.hpp"
#include "packets.hpp"
#include "rpc.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

/*
 * Client game loop body. Owns the handles the server asked for, routes
 * their RPCs and tracks the session state.
 *
 * State goes Connecting -> Connected when the server acknowledges the
 * login, and Disconnected on logout, kick, server shutdown or a lost
 * connection. Keep-alives are acknowledged so an idle client keeps its
 * session.
 */
class client_runtime {
public:
  using handle_factory = std::function<std::unique_ptr<i_client_handle>()>;

  client_runtime(i_client_transport &transport, std::shared_ptr<spdlog::logger> logger,
                 const client_id &self = Id::generate());
  ~client_runtime();

  client_runtime(const client_runtime &) = delete;
  client_runtime &operator=(const client_runtime &) = delete;

  bool register_handle(const HandleType &type, handle_factory factory);

  SendResult send_register(const std::string &client_version);
  SendResult login();
  SendResult logout();
  SendResult ping(const std::string &text);

  // Drains the transport, handles every packet, then updates the handles
  void tick(float dt);

  ConnectionState state() const { return m_state; }
  const client_id &id() const { return m_self; }
  data_store &store() { return m_store; }

  std::size_t handle_count() const { return m_handles.size(); }
  bool has_handle(const entity_id &entity) const { return m_handles.count(entity) > 0; }
  client_messenger *messenger_for(const entity_id &entity);

  // Other clients the server announced
  const std::set<client_id> &peers() const { return m_peers; }
  const std::optional<ServerInfo> &server_info() const { return m_server_info; }
  const std::string &disconnect_reason() const { return m_disconnect_reason; }

private:
  struct registered_type {
    std::string name;
    handle_factory factory;
  };

  struct handle_entry {
    std::unique_ptr<client_messenger> messenger;
    std::unique_ptr<i_client_handle> handle;
  };

  void handle_packet(const ServerPacket &packet);
  void handle_event(const ConnectionEvent &event);
  void add_handle(const entity_id &entity, const handle_type_id &type);
  void remove_handle(const entity_id &entity);
  void disconnect(const std::string &reason);
  SendResult send(ClientMessage message, SendMode mode);
  // Answers a server packet under its conversation id
  SendResult reply(const conv_id &conversation, ClientMessage message, SendMode mode);

  i_client_transport &m_transport;
  std::shared_ptr<spdlog::logger> m_logger;
  client_id m_self;
  ConnectionState m_state = ConnectionState::Connecting;
  std::optional<conv_id> m_login_conversation;
  std::string m_disconnect_reason;

  std::map<handle_type_id, registered_type> m_types;
  std::map<entity_id, handle_entry> m_handles;
  data_store m_store;
  std::set<client_id> m_peers;
  std::optional<ServerInfo> m_server_info;
};
