#pragma once

#include "config.hpp"
#include "datagram_sender.hpp"
#include "i_client_transport.hpp"
#include "packet_inbox.hpp"
#include "stream_writer.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <SFML/Network/TcpSocket.hpp>
#include <SFML/Network/UdpSocket.hpp>
#include <spdlog/spdlog.h>

// Client end of the two channels: one stream connection to the server
// and one datagram socket. Both readers push into a single inbox.
class NetworkClient : public i_client_transport {
public:
  explicit NetworkClient(std::shared_ptr<spdlog::logger> logger);
  ~NetworkClient() override;

  NetworkClient(const NetworkClient &) = delete;
  NetworkClient &operator=(const NetworkClient &) = delete;

  // Blocks up to config.connect_timeout_ms for the stream connection
  bool connect(const ClientConfig &config);
  void stop();

  std::vector<ClientInboxEntry> drain() override;
  SendResult send(const ClientPacket &packet, SendMode mode) override;
  ConnectionState state() const override { return m_state; }

  std::uint16_t local_udp_port() const { return m_udp.getLocalPort(); }
  Endpoint server_endpoint() const { return m_server; }

private:
  void receive_datagrams();
  void read_stream();
  void fail(const std::string &reason);

  std::shared_ptr<spdlog::logger> m_logger;
  sf::UdpSocket m_udp;
  sf::TcpSocket m_stream;
  std::unique_ptr<StreamWriter> m_writer;
  std::unique_ptr<DatagramSender> m_datagrams;
  PacketInbox<ClientInboxEntry> m_inbox;

  Endpoint m_server;
  std::atomic<ConnectionState> m_state{ConnectionState::Disconnected};
  std::atomic<bool> m_running{false};
  std::thread m_udp_thread;
  std::thread m_stream_thread;
};
