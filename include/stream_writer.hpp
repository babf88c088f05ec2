#pragma once

#include "net_types.hpp"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <SFML/Network/TcpSocket.hpp>
#include <spdlog/spdlog.h>

// Frame output of one stream connection. Callers enqueue whole frames and
// return at once; one worker thread writes them in order. The socket must
// be non-blocking so a peer that stops reading cannot pin the worker.
class StreamWriter {
public:
  using error_callback = std::function<void(const std::string &reason)>;

  StreamWriter(sf::TcpSocket &socket, std::size_t queue_limit,
               std::shared_ptr<spdlog::logger> logger, error_callback on_error);
  ~StreamWriter();

  StreamWriter(const StreamWriter &) = delete;
  StreamWriter &operator=(const StreamWriter &) = delete;

  void start();
  // Frames already queued get one more attempt; a full socket buffer
  // ends the attempt
  void stop();

  // NotConnected once a write has failed
  SendResult enqueue(std::vector<std::uint8_t> frame);

  std::size_t pending() const;
  bool failed() const;

private:
  void run();
  bool running() const;
  bool write_all(const std::vector<std::uint8_t> &frame);

  sf::TcpSocket &m_socket;
  std::size_t m_queue_limit;
  std::shared_ptr<spdlog::logger> m_logger;
  error_callback m_on_error;

  mutable std::mutex m_mutex;
  std::condition_variable m_wake;
  std::deque<std::vector<std::uint8_t>> m_queue;
  bool m_running = false;
  bool m_failed = false;
  std::thread m_worker;
};
