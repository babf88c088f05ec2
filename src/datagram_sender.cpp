#include "datagram_sender.hpp"
#include <SFML/Network/IpAddress.hpp>
#include <utility>

DatagramSender::DatagramSender(sf::UdpSocket &socket, std::size_t queue_limit,
                               std::shared_ptr<spdlog::logger> logger)
    : m_socket(socket), m_queue_limit(queue_limit), m_logger(std::move(logger)) {}

DatagramSender::~DatagramSender() { stop(); }

void DatagramSender::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running)
        return;
    m_running = true;
    m_worker = std::thread(&DatagramSender::run, this);
}

void DatagramSender::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_running = false;
    }
    m_wake.notify_all();
    if (m_worker.joinable())
        m_worker.join();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.clear();
}

SendResult DatagramSender::enqueue(const Endpoint &to, std::vector<std::uint8_t> bytes) {
    if (bytes.size() > MAX_PACKET_SIZE) {
        m_logger->warn("packet is too large: {} > {}", bytes.size(), MAX_PACKET_SIZE);
        return SendResult::TooLarge;
    }
    if (!to.is_valid())
        return SendResult::NotConnected;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.size() >= m_queue_limit) {
            m_logger->warn("datagram queue full ({} entries), dropping datagram to {}",
                           m_queue.size(), to.to_string());
            return SendResult::QueueFull;
        }
        m_queue.push_back(Datagram{to, std::move(bytes)});
    }
    m_wake.notify_one();
    return SendResult::Ok;
}

std::size_t DatagramSender::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void DatagramSender::run() {
    while (true) {
        Datagram datagram;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait(lock, [this] { return !m_running || !m_queue.empty(); });
            if (!m_running)
                return;
            datagram = std::move(m_queue.front());
            m_queue.pop_front();
        }

        auto status = m_socket.send(datagram.bytes.data(), datagram.bytes.size(),
                                    sf::IpAddress(datagram.to.address), datagram.to.port);
        if (status != sf::Socket::Status::Done) {
            m_logger->error("couldn't send datagram of {} bytes to {}",
                            datagram.bytes.size(), datagram.to.to_string());
        }
    }
}
