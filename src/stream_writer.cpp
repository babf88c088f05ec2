#include "stream_writer.hpp"
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <utility>

namespace {
constexpr int RETRY_INTERVAL_MS = 1;
}

StreamWriter::StreamWriter(sf::TcpSocket &socket, std::size_t queue_limit,
                           std::shared_ptr<spdlog::logger> logger, error_callback on_error)
    : m_socket(socket), m_queue_limit(queue_limit), m_logger(std::move(logger)),
      m_on_error(std::move(on_error)) {}

StreamWriter::~StreamWriter() { stop(); }

void StreamWriter::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running || m_worker.joinable())
        return;
    m_running = true;
    m_worker = std::thread(&StreamWriter::run, this);
}

void StreamWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running = false;
    }
    m_wake.notify_all();
    if (m_worker.joinable())
        m_worker.join();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.clear();
}

SendResult StreamWriter::enqueue(std::vector<std::uint8_t> frame) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_failed)
            return SendResult::NotConnected;
        if (m_queue.size() >= m_queue_limit) {
            m_logger->warn("stream queue full ({} frames), dropping frame of {} bytes",
                           m_queue.size(), frame.size());
            return SendResult::QueueFull;
        }
        m_queue.push_back(std::move(frame));
    }
    m_wake.notify_one();
    return SendResult::Ok;
}

std::size_t StreamWriter::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool StreamWriter::failed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failed;
}

bool StreamWriter::running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

void StreamWriter::run() {
    while (true) {
        std::vector<std::uint8_t> frame;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait(lock, [this] { return !m_running || !m_queue.empty(); });
            if (m_queue.empty())
                return;
            frame = std::move(m_queue.front());
            m_queue.pop_front();
        }

        if (write_all(frame))
            continue;
        if (!running())
            return;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_failed = true;
            m_queue.clear();
        }
        m_logger->error("couldn't write frame of {} bytes", frame.size());
        if (m_on_error)
            m_on_error("stream write error");
        return;
    }
}

bool StreamWriter::write_all(const std::vector<std::uint8_t> &frame) {
    std::size_t offset = 0;
    while (offset < frame.size()) {
        std::size_t sent = 0;
        auto status = m_socket.send(frame.data() + offset, frame.size() - offset, sent);
        offset += sent;
        if (status == sf::Socket::Status::Done)
            return true;
        if (status == sf::Socket::Status::Partial)
            continue;
        if (status != sf::Socket::Status::NotReady)
            return false;
        // Peer is not reading; give up only when asked to stop
        if (!running())
            return false;
        sf::sleep(sf::milliseconds(RETRY_INTERVAL_MS));
    }
    return true;
}
