#pragma once

#include "config.hpp"
#include "i_server_transport.hpp"
#include "id.hpp"
#include "packets.hpp"
#include "world.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

/*
 * Server game loop body: drains the transport once per tick, keeps the
 * client sessions (login, logout, liveness) and routes mod messages into
 * the world.
 */
class server_runtime {
public:
  using clock = std::chrono::steady_clock;
  using reply_handler = std::function<void(server_runtime &, const ClientPacket &)>;

  server_runtime(const ServerConfig &config, i_server_transport &transport,
                 std::shared_ptr<spdlog::logger> logger);

  server_runtime(const server_runtime &) = delete;
  server_runtime &operator=(const server_runtime &) = delete;

  world &game_world() { return m_world; }
  const world &game_world() const { return m_world; }

  // One iteration: handle everything received, expire silent clients,
  // send keep-alives, then tick the world
  void tick(clock::time_point now = clock::now());

  // Sends Kick and ends the session
  bool kick(const client_id &client, const std::string &reason);
  // Tells every client the server is going away
  void shutdown(const std::string &reason);

  // Sends message to a logged in client and runs on_reply for the first
  // packet that client sends under the same conversation id. Handlers
  // still waiting when the session ends are dropped.
  SendResult request(const client_id &client, ServerMessage message, reply_handler on_reply,
                     SendMode mode = SendMode::Safe);
  std::size_t pending_replies(const client_id &client) const;

  bool has_session(const client_id &client) const { return m_sessions.count(client) > 0; }
  std::size_t session_count() const { return m_sessions.size(); }
  std::vector<client_id> sessions() const;

  ServerInfo &info() { return m_info; }

private:
  struct session {
    std::string name;
    clock::time_point last_seen;
    std::map<conv_id, reply_handler> awaiting;
  };

  void handle_packet(const ReceivedPacket &received, clock::time_point now);
  void handle_event(const ConnectionEvent &event);
  void run_reply_handler(const ClientPacket &packet);

  void login(const ClientPacket &packet, clock::time_point now);
  void answer_register(const client_id &client, const client_msg::Register &request);
  void end_session(const client_id &client, const std::string &reason);

  void reply(const client_id &client, ServerMessage message, SendMode mode);
  void broadcast(const ServerMessage &message, const client_id &except);
  void expire_sessions(clock::time_point now);
  void send_keep_alives(clock::time_point now);

  ServerConfig m_config;
  i_server_transport &m_transport;
  std::shared_ptr<spdlog::logger> m_logger;
  world m_world;
  ServerInfo m_info;

  std::map<client_id, session> m_sessions;
  clock::time_point m_last_keep_alive{};
};
