#include "network_server.hpp"
#include "frame_decoder.hpp"
#include "wire_format.hpp"
#include <SFML/Network/IpAddress.hpp>
#include <SFML/Network/SocketSelector.hpp>
#include <SFML/System/Time.hpp>
#include <string>
#include <utility>

namespace {

// Receiver threads wake up this often to notice a stop request
constexpr int POLL_INTERVAL_MS = 100;

Endpoint remote_endpoint(const sf::TcpSocket &socket) {
    auto address = socket.getRemoteAddress();
    return Endpoint{address ? address->toInteger() : 0, socket.getRemotePort()};
}

} // namespace

NetworkServer::NetworkServer(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

NetworkServer::~NetworkServer() { stop(); }

bool NetworkServer::start(const ServerConfig &config) {
    if (m_running)
        return true;

    auto address = sf::IpAddress::resolve(config.bind_address);
    if (!address) {
        m_logger->error("Invalid bind address: {}", config.bind_address);
        return false;
    }

    if (m_udp.bind(config.port, *address) != sf::Socket::Status::Done) {
        m_logger->error("Failed to bind datagram socket on port {}", config.port);
        return false;
    }
    m_port = m_udp.getLocalPort();
    m_queue_limit = config.outbound_queue_limit;

    // The stream listener shares the datagram port so clients need one address
    if (m_listener.listen(m_port, *address) != sf::Socket::Status::Done) {
        m_logger->error("Failed to listen on port {}", m_port);
        m_udp.unbind();
        return false;
    }

    m_datagrams = std::make_unique<DatagramSender>(m_udp, config.outbound_queue_limit, m_logger);
    m_datagrams->start();

    m_running = true;
    m_udp_thread = std::thread(&NetworkServer::receive_datagrams, this);
    m_accept_thread = std::thread(&NetworkServer::accept_streams, this);

    m_logger->info("Server listening on {}:{}", address->toString(), m_port);
    return true;
}

void NetworkServer::stop() {
    if (!m_running.exchange(false))
        return;

    if (m_udp_thread.joinable())
        m_udp_thread.join();
    if (m_accept_thread.joinable())
        m_accept_thread.join();
    reap_connections(true);

    if (m_datagrams)
        m_datagrams->stop();
    m_listener.close();
    m_udp.unbind();

    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        m_streams.clear();
        m_datagram_endpoints.clear();
    }
    m_logger->info("Server stopped");
}

std::vector<ServerInboxEntry> NetworkServer::drain() { return m_inbox.drain(); }

bool NetworkServer::register_client(const client_id &client) {
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    return m_clients.emplace(client, std::chrono::steady_clock::now()).second;
}

bool NetworkServer::remove_client(const client_id &client) {
    bool removed = false;
    std::shared_ptr<StreamConnection> stream;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        m_datagram_endpoints.erase(client);
        removed = m_clients.erase(client) > 0;
        auto it = m_streams.find(client);
        if (it != m_streams.end())
            stream = it->second;
    }
    // close_stream takes m_clients_mutex itself
    if (stream)
        close_stream(stream, "session ended", false);
    return removed;
}

bool NetworkServer::has_client(const client_id &client) const {
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    return m_clients.count(client) > 0;
}

std::vector<client_id> NetworkServer::client_ids() const {
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    std::vector<client_id> ids;
    ids.reserve(m_clients.size());
    for (auto const &[id, last_seen] : m_clients) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<ClientInfo> NetworkServer::client_info(const client_id &client) const {
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    auto it = m_clients.find(client);
    if (it == m_clients.end())
        return std::nullopt;

    ClientInfo info;
    info.last_seen = it->second;
    auto datagram = m_datagram_endpoints.find(client);
    if (datagram != m_datagram_endpoints.end())
        info.datagram_endpoint = datagram->second;
    auto stream = m_streams.find(client);
    if (stream != m_streams.end()) {
        info.stream_endpoint = stream->second->remote;
        info.stream_connected = stream->second->open;
    }
    return info;
}

std::size_t NetworkServer::pending_datagrams() const {
    return m_datagrams ? m_datagrams->pending() : 0;
}

SendResult NetworkServer::send(const client_id &client, const ServerPacket &packet,
                               SendMode mode) {
    std::vector<std::uint8_t> bytes = encode(packet);

    if (mode == SendMode::Quick) {
        if (bytes.size() > MAX_PACKET_SIZE) {
            m_logger->warn("Packet is too large: {} > {}", bytes.size(), MAX_PACKET_SIZE);
            return SendResult::TooLarge;
        }

        Endpoint to;
        {
            std::lock_guard<std::mutex> lock(m_clients_mutex);
            if (m_clients.count(client) == 0)
                return SendResult::UnknownClient;
            auto it = m_datagram_endpoints.find(client);
            if (it == m_datagram_endpoints.end())
                return SendResult::NotConnected;
            to = it->second;
        }
        if (!m_datagrams)
            return SendResult::NotConnected;
        return m_datagrams->enqueue(to, std::move(bytes));
    }

    std::shared_ptr<StreamConnection> stream;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        auto it = m_streams.find(client);
        if (it != m_streams.end())
            stream = it->second;
        else if (m_clients.count(client) == 0)
            return SendResult::UnknownClient;
    }
    if (!stream || !stream->open)
        return SendResult::NotConnected;

    return stream->writer->enqueue(encode_frame(bytes));
}

void NetworkServer::receive_datagrams() {
    std::vector<std::uint8_t> buffer(sf::UdpSocket::MaxDatagramSize);
    sf::SocketSelector selector;
    selector.add(m_udp);

    while (m_running) {
        if (!selector.wait(sf::milliseconds(POLL_INTERVAL_MS)))
            continue;

        std::size_t received = 0;
        std::optional<sf::IpAddress> sender;
        unsigned short sender_port = 0;
        auto status = m_udp.receive(buffer.data(), buffer.size(), received, sender, sender_port);
        if (status != sf::Socket::Status::Done) {
            m_logger->error("Couldn't receive a datagram");
            continue;
        }

        Endpoint source{sender ? sender->toInteger() : 0, sender_port};
        try {
            ClientPacket packet = decode<ClientPacket>(buffer.data(), received);
            {
                std::lock_guard<std::mutex> lock(m_clients_mutex);
                auto it = m_clients.find(packet.client);
                if (it != m_clients.end()) {
                    it->second = std::chrono::steady_clock::now();
                    m_datagram_endpoints[packet.client] = source;
                }
            }
            m_inbox.push(ReceivedPacket{std::move(packet), SendMode::Quick, source});
        } catch (const DecodeError &e) {
            m_logger->error("Invalid client packet from {}: {}", source.to_string(), e.what());
        }
    }
}

void NetworkServer::accept_streams() {
    sf::SocketSelector selector;
    selector.add(m_listener);

    while (m_running) {
        reap_connections(false);
        if (!selector.wait(sf::milliseconds(POLL_INTERVAL_MS)))
            continue;

        auto connection = std::make_shared<StreamConnection>();
        if (m_listener.accept(connection->socket) != sf::Socket::Status::Done) {
            m_logger->error("Can't accept connection");
            continue;
        }
        connection->socket.setBlocking(false);
        connection->remote = remote_endpoint(connection->socket);
        m_logger->info("Accepted connection from {}", connection->remote.to_string());

        std::weak_ptr<StreamConnection> weak = connection;
        connection->writer = std::make_unique<StreamWriter>(
            connection->socket, m_queue_limit, m_logger, [this, weak](const std::string &reason) {
                if (auto failed = weak.lock())
                    close_stream(failed, reason, true);
            });
        connection->writer->start();

        std::lock_guard<std::mutex> lock(m_connections_mutex);
        connection->reader = std::thread(&NetworkServer::read_stream, this, connection);
        m_connections.push_back(std::move(connection));
    }
}

void NetworkServer::read_stream(std::shared_ptr<StreamConnection> connection) {
    FrameDecoder decoder(MAX_FRAME_SIZE);
    sf::SocketSelector selector;
    selector.add(connection->socket);
    std::uint8_t chunk[4096];
    std::string reason = "server shutting down";

    while (m_running && connection->open) {
        if (!selector.wait(sf::milliseconds(POLL_INTERVAL_MS)))
            continue;

        std::size_t received = 0;
        auto status = connection->socket.receive(chunk, sizeof(chunk), received);
        if (status == sf::Socket::Status::NotReady)
            continue;
        if (status == sf::Socket::Status::Disconnected) {
            reason = "connection closed by peer";
            break;
        }
        if (status != sf::Socket::Status::Done) {
            reason = "stream read error";
            break;
        }

        decoder.feed(chunk, received);
        try {
            while (auto frame = decoder.next()) {
                ClientPacket packet = decode<ClientPacket>(*frame);
                bind_stream(connection, packet.client);
                touch(packet.client);
                m_inbox.push(ReceivedPacket{std::move(packet), SendMode::Safe, connection->remote});
            }
        } catch (const DecodeError &e) {
            // Frame boundaries can no longer be trusted
            m_logger->error("Invalid client packet from {}: {}",
                            connection->remote.to_string(), e.what());
            reason = std::string("invalid frame: ") + e.what();
            break;
        }
    }

    close_stream(connection, reason, true);
    connection->writer->stop();
    connection->socket.disconnect();
}

void NetworkServer::bind_stream(const std::shared_ptr<StreamConnection> &connection,
                                const client_id &client) {
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    if (connection->owner)
        return;
    connection->owner = client;
    m_streams[client] = connection;
}

void NetworkServer::close_stream(const std::shared_ptr<StreamConnection> &connection,
                                 const std::string &reason, bool notify) {
    if (!connection->open.exchange(false))
        return;

    std::optional<client_id> owner;
    {
        std::lock_guard<std::mutex> lock(m_clients_mutex);
        owner = connection->owner;
        if (owner) {
            auto it = m_streams.find(*owner);
            if (it != m_streams.end() && it->second == connection)
                m_streams.erase(it);
        }
    }

    m_logger->info("Connection {} closed: {}", connection->remote.to_string(), reason);
    if (notify && owner && m_running) {
        m_inbox.push(ConnectionEvent{*owner, ConnectionState::Disconnected, reason});
    }
}

void NetworkServer::touch(const client_id &client) {
    std::lock_guard<std::mutex> lock(m_clients_mutex);
    auto it = m_clients.find(client);
    if (it != m_clients.end())
        it->second = std::chrono::steady_clock::now();
}

void NetworkServer::reap_connections(bool all) {
    std::lock_guard<std::mutex> lock(m_connections_mutex);
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        auto &connection = *it;
        if (all || !connection->open) {
            if (connection->reader.joinable())
                connection->reader.join();
            it = m_connections.erase(it);
        } else {
            ++it;
        }
    }
}
