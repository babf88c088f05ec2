#pragma once

#include "config.hpp"
#include "datagram_sender.hpp"
#include "i_server_transport.hpp"
#include "packet_inbox.hpp"
#include "stream_writer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <SFML/Network/TcpListener.hpp>
#include <SFML/Network/TcpSocket.hpp>
#include <SFML/Network/UdpSocket.hpp>
#include <spdlog/spdlog.h>

struct ClientInfo {
  Endpoint datagram_endpoint; // invalid until the client sent a datagram
  Endpoint stream_endpoint;   // invalid until the client sent a frame
  std::chrono::steady_clock::time_point last_seen;
  bool stream_connected = false;
};

// Listens for clients on one UDP socket (quick channel) and one TCP
// listener (safe channel) bound to the same port. Receiver threads decode
// incoming bytes and push them into the inbox drained by the game loop.
class NetworkServer : public i_server_transport {
public:
  explicit NetworkServer(std::shared_ptr<spdlog::logger> logger);
  ~NetworkServer() override;

  NetworkServer(const NetworkServer &) = delete;
  NetworkServer &operator=(const NetworkServer &) = delete;

  bool start(const ServerConfig &config);
  void stop();
  bool is_running() const { return m_running; }
  // Port actually bound (useful when started on port 0)
  std::uint16_t port() const { return m_port; }

  std::vector<ServerInboxEntry> drain() override;
  bool register_client(const client_id &client) override;
  // Also closes the stream bound to the client
  bool remove_client(const client_id &client) override;
  bool has_client(const client_id &client) const override;
  std::vector<client_id> client_ids() const override;
  // Safe sends reach any client whose stream is bound, registered or not;
  // quick sends need a registered client with a learned endpoint
  SendResult send(const client_id &client, const ServerPacket &packet,
                  SendMode mode) override;

  std::optional<ClientInfo> client_info(const client_id &client) const;
  std::size_t pending_datagrams() const;

private:
  // The reader thread owns teardown: once open is cleared it stops the
  // writer and closes the socket
  struct StreamConnection {
    sf::TcpSocket socket;
    std::unique_ptr<StreamWriter> writer;
    std::thread reader;
    std::atomic<bool> open{true};
    Endpoint remote;
    std::optional<client_id> owner; // guarded by m_clients_mutex
  };

  void receive_datagrams();
  void accept_streams();
  void read_stream(std::shared_ptr<StreamConnection> connection);
  void bind_stream(const std::shared_ptr<StreamConnection> &connection,
                   const client_id &client);
  // Marks the connection closed and unbinds it; notify reports the loss
  // to the session loop
  void close_stream(const std::shared_ptr<StreamConnection> &connection,
                    const std::string &reason, bool notify);
  void touch(const client_id &client);
  void reap_connections(bool all);

  std::shared_ptr<spdlog::logger> m_logger;
  sf::UdpSocket m_udp;
  sf::TcpListener m_listener;
  std::unique_ptr<DatagramSender> m_datagrams;
  PacketInbox<ServerInboxEntry> m_inbox;

  std::atomic<bool> m_running{false};
  std::uint16_t m_port = 0;
  std::size_t m_queue_limit = 0;
  std::thread m_udp_thread;
  std::thread m_accept_thread;

  mutable std::mutex m_clients_mutex;
  // Registered (logged in) clients and when they were last heard from
  std::map<client_id, std::chrono::steady_clock::time_point> m_clients;
  // Channels learned from traffic of registered clients
  std::map<client_id, Endpoint> m_datagram_endpoints;
  std::map<client_id, std::shared_ptr<StreamConnection>> m_streams;

  std::mutex m_connections_mutex;
  std::vector<std::shared_ptr<StreamConnection>> m_connections;
};
