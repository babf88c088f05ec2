#include "network_client.hpp"
#include "frame_decoder.hpp"
#include "wire_format.hpp"
#include <SFML/Network/IpAddress.hpp>
#include <SFML/Network/SocketSelector.hpp>
#include <SFML/System/Time.hpp>
#include <optional>
#include <utility>

namespace {
constexpr int POLL_INTERVAL_MS = 100;
}

NetworkClient::NetworkClient(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

NetworkClient::~NetworkClient() { stop(); }

bool NetworkClient::connect(const ClientConfig &config) {
    if (m_running)
        return true;

    auto address = sf::IpAddress::resolve(config.server_address);
    if (!address) {
        m_logger->error("Can't resolve server address {}", config.server_address);
        return false;
    }
    m_server = Endpoint{address->toInteger(), config.server_port};
    m_state = ConnectionState::Connecting;

    m_logger->info("Connecting to {}", m_server.to_string());
    auto status = m_stream.connect(*address, config.server_port,
                                   sf::milliseconds(static_cast<std::int32_t>(config.connect_timeout_ms)));
    if (status != sf::Socket::Status::Done) {
        m_logger->error("Failed to connect to {}", m_server.to_string());
        m_state = ConnectionState::Disconnected;
        return false;
    }

    if (m_udp.bind(config.local_udp_port) != sf::Socket::Status::Done) {
        m_logger->error("Failed to bind datagram socket on port {}", config.local_udp_port);
        m_stream.disconnect();
        m_state = ConnectionState::Disconnected;
        return false;
    }

    m_stream.setBlocking(false);
    m_writer = std::make_unique<StreamWriter>(m_stream, config.outbound_queue_limit, m_logger,
                                              [this](const std::string &reason) { fail(reason); });
    m_writer->start();
    m_datagrams = std::make_unique<DatagramSender>(m_udp, config.outbound_queue_limit, m_logger);
    m_datagrams->start();

    m_running = true;
    m_state = ConnectionState::Connected;
    m_udp_thread = std::thread(&NetworkClient::receive_datagrams, this);
    m_stream_thread = std::thread(&NetworkClient::read_stream, this);

    m_logger->info("Connected to {} (datagram port {})", m_server.to_string(),
                   m_udp.getLocalPort());
    return true;
}

void NetworkClient::stop() {
    if (!m_running.exchange(false))
        return;

    if (m_udp_thread.joinable())
        m_udp_thread.join();
    if (m_stream_thread.joinable())
        m_stream_thread.join();
    if (m_writer)
        m_writer->stop();
    if (m_datagrams)
        m_datagrams->stop();

    m_stream.disconnect();
    m_udp.unbind();
    m_state = ConnectionState::Disconnected;
    m_logger->info("Disconnected from {}", m_server.to_string());
}

std::vector<ClientInboxEntry> NetworkClient::drain() { return m_inbox.drain(); }

SendResult NetworkClient::send(const ClientPacket &packet, SendMode mode) {
    std::vector<std::uint8_t> bytes = encode(packet);

    if (mode == SendMode::Quick) {
        if (bytes.size() > MAX_PACKET_SIZE) {
            m_logger->warn("Packet is too large: {} > {}", bytes.size(), MAX_PACKET_SIZE);
            return SendResult::TooLarge;
        }
        if (m_state != ConnectionState::Connected || !m_datagrams)
            return SendResult::NotConnected;
        return m_datagrams->enqueue(m_server, std::move(bytes));
    }

    if (m_state != ConnectionState::Connected || !m_writer)
        return SendResult::NotConnected;
    return m_writer->enqueue(encode_frame(bytes));
}

void NetworkClient::receive_datagrams() {
    std::vector<std::uint8_t> buffer(sf::UdpSocket::MaxDatagramSize);
    sf::SocketSelector selector;
    selector.add(m_udp);

    while (m_running) {
        if (!selector.wait(sf::milliseconds(POLL_INTERVAL_MS)))
            continue;

        std::size_t received = 0;
        std::optional<sf::IpAddress> sender;
        unsigned short sender_port = 0;
        if (m_udp.receive(buffer.data(), buffer.size(), received, sender, sender_port) !=
            sf::Socket::Status::Done) {
            m_logger->error("Couldn't receive a datagram");
            continue;
        }

        try {
            m_inbox.push(decode<ServerPacket>(buffer.data(), received));
        } catch (const DecodeError &e) {
            Endpoint source{sender ? sender->toInteger() : 0, sender_port};
            m_logger->error("Invalid server packet from {}: {}", source.to_string(), e.what());
        }
    }
}

void NetworkClient::read_stream() {
    FrameDecoder decoder(MAX_FRAME_SIZE);
    sf::SocketSelector selector;
    selector.add(m_stream);
    std::uint8_t chunk[4096];

    while (m_running) {
        if (!selector.wait(sf::milliseconds(POLL_INTERVAL_MS)))
            continue;

        std::size_t received = 0;
        auto status = m_stream.receive(chunk, sizeof(chunk), received);
        if (status == sf::Socket::Status::NotReady)
            continue;
        if (status == sf::Socket::Status::Disconnected) {
            fail("connection closed by server");
            return;
        }
        if (status != sf::Socket::Status::Done) {
            fail("stream read error");
            return;
        }

        decoder.feed(chunk, received);
        try {
            while (auto frame = decoder.next()) {
                m_inbox.push(decode<ServerPacket>(*frame));
            }
        } catch (const DecodeError &e) {
            m_logger->error("Invalid server packet on stream: {}", e.what());
            fail(std::string("invalid frame: ") + e.what());
            return;
        }
    }
}

void NetworkClient::fail(const std::string &reason) {
    if (m_state.exchange(ConnectionState::Disconnected) == ConnectionState::Disconnected)
        return;
    m_logger->warn("Connection to {} lost: {}", m_server.to_string(), reason);
    m_inbox.push(ConnectionEvent{Id::nil(), ConnectionState::Disconnected, reason});
}
