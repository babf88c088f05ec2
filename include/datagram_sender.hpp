#pragma once

#include "net_types.hpp"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <SFML/Network/UdpSocket.hpp>
#include <spdlog/spdlog.h>

// Fire-and-forget datagram output: callers enqueue, one worker thread
// writes to the socket. The queue is bounded; nothing is retried.
class DatagramSender {
public:
  DatagramSender(sf::UdpSocket &socket, std::size_t queue_limit,
                 std::shared_ptr<spdlog::logger> logger);
  ~DatagramSender();

  DatagramSender(const DatagramSender &) = delete;
  DatagramSender &operator=(const DatagramSender &) = delete;

  void start();
  // Joins the worker; datagrams still queued are discarded
  void stop();

  // Rejects payloads over MAX_PACKET_SIZE before anything is queued
  SendResult enqueue(const Endpoint &to, std::vector<std::uint8_t> bytes);

  std::size_t pending() const;

private:
  struct Datagram {
    Endpoint to;
    std::vector<std::uint8_t> bytes;
  };

  void run();

  sf::UdpSocket &m_socket;
  std::size_t m_queue_limit;
  std::shared_ptr<spdlog::logger> m_logger;

  mutable std::mutex m_mutex;
  std::condition_variable m_wake;
  std::deque<Datagram> m_queue;
  bool m_running = false;
  std::thread m_worker;
};
