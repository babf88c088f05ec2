#include "server_runtime.hpp"
#include "modules/connection_listener.hpp"
#include "modules/messenger.hpp"
#include <exception>
#include <utility>
#include <variant>

server_runtime::server_runtime(const ServerConfig &config, i_server_transport &transport,
                               std::shared_ptr<spdlog::logger> logger)
    : m_config(config), m_transport(transport), m_logger(logger), m_world(logger) {
    m_world.set_transport(&m_transport);
    m_info.server_version = config.server_version;
    m_info.mod_profile = "default";
    m_info.mod_version = config.server_version;
}

std::vector<client_id> server_runtime::sessions() const {
    std::vector<client_id> ids;
    ids.reserve(m_sessions.size());
    for (auto const &[id, s] : m_sessions) {
        ids.push_back(id);
    }
    return ids;
}

void server_runtime::tick(clock::time_point now) {
    for (auto &entry : m_transport.drain()) {
        if (auto *received = std::get_if<ReceivedPacket>(&entry))
            handle_packet(*received, now);
        else
            handle_event(std::get<ConnectionEvent>(entry));
    }

    expire_sessions(now);
    send_keep_alives(now);
    m_world.tick();
}

void server_runtime::handle_packet(const ReceivedPacket &received, clock::time_point now) {
    const ClientPacket &packet = received.packet;
    const client_id &client = packet.client;
    m_logger->trace("{} from {} ({})", message_name(packet.message), client.to_string(),
                    to_string(received.channel));

    if (std::holds_alternative<client_msg::Login>(packet.message)) {
        login(packet, now);
        return;
    }
    if (auto *request = std::get_if<client_msg::Register>(&packet.message)) {
        answer_register(client, *request);
        return;
    }

    auto it = m_sessions.find(client);
    if (it == m_sessions.end()) {
        m_logger->warn("Dropping {} from unknown client {}", message_name(packet.message),
                       client.to_string());
        return;
    }
    it->second.last_seen = now;

    if (it->second.awaiting.count(packet.conversation) > 0) {
        run_reply_handler(packet);
        // The handler may have ended the session
        if (!has_session(client))
            return;
    }

    if (std::holds_alternative<client_msg::Logout>(packet.message)) {
        end_session(client, "logged out");
    } else if (auto *ping = std::get_if<client_msg::Ping>(&packet.message)) {
        reply(client, server_msg::Pong{ping->text}, received.channel);
    } else if (auto *mod = std::get_if<client_msg::ModMessage>(&packet.message)) {
        route_mod_message(m_world, client, *mod);
    } else if (auto *raw = std::get_if<client_msg::RawData>(&packet.message)) {
        m_logger->debug("{} bytes of raw data from {}", raw->bytes.size(), client.to_string());
    }
    // Pong and Acknowledge only refresh last_seen
}

void server_runtime::run_reply_handler(const ClientPacket &packet) {
    auto &awaiting = m_sessions.at(packet.client).awaiting;
    auto waiting = awaiting.find(packet.conversation);
    reply_handler handler = std::move(waiting->second);
    awaiting.erase(waiting);

    world::dispatch_scope scope(m_world);
    try {
        handler(*this, packet);
    } catch (const std::exception &e) {
        m_logger->error("Reply handler for {} from {} failed: {}", message_name(packet.message),
                        packet.client.to_string(), e.what());
    }
}

SendResult server_runtime::request(const client_id &client, ServerMessage message,
                                   reply_handler on_reply, SendMode mode) {
    auto it = m_sessions.find(client);
    if (it == m_sessions.end())
        return SendResult::UnknownClient;

    ServerPacket packet = make_server_packet(std::move(message));
    auto result = m_transport.send(client, packet, mode);
    if (result != SendResult::Ok) {
        m_logger->warn("Couldn't send {} to {}: {}", message_name(packet.message),
                       client.to_string(), to_string(result));
        return result;
    }
    if (on_reply)
        it->second.awaiting.emplace(packet.conversation, std::move(on_reply));
    return result;
}

std::size_t server_runtime::pending_replies(const client_id &client) const {
    auto it = m_sessions.find(client);
    return it == m_sessions.end() ? 0 : it->second.awaiting.size();
}

void server_runtime::handle_event(const ConnectionEvent &event) {
    if (event.state != ConnectionState::Disconnected)
        return;
    if (m_sessions.count(event.peer) == 0)
        return;
    m_logger->info("Lost connection to {}: {}", event.peer.to_string(), event.reason);
    end_session(event.peer, event.reason);
}

void server_runtime::login(const ClientPacket &packet, clock::time_point now) {
    const client_id &client = packet.client;

    auto existing = m_sessions.find(client);
    if (existing != m_sessions.end()) {
        existing->second.last_seen = now;
        reply(client, server_msg::Acknowledge{packet.conversation}, SendMode::Safe);
        return;
    }

    m_transport.register_client(client);
    std::string name = client.to_string();
    m_sessions.emplace(client, session{name, now, {}});
    m_logger->info("Client {} logged in ({} online)", name, m_sessions.size());

    reply(client, server_msg::Acknowledge{packet.conversation}, SendMode::Safe);
    broadcast(server_msg::Login{client, name}, client);

    world::dispatch_scope scope(m_world);
    for (auto const &id : m_world.find_with<connection_listener>()) {
        if (auto *listener = m_world.mut_module_of<connection_listener>(id))
            listener->on_join(id, m_world, client);
    }
}

void server_runtime::answer_register(const client_id &client,
                                     const client_msg::Register &request) {
    server_msg::RegisterResponse response;
    if (request.client_version == m_config.server_version) {
        response.result = m_info;
    } else {
        response.result = "version mismatch: server " + m_config.server_version + ", client " +
                          request.client_version;
        m_logger->warn("Refusing client {}: {}", client.to_string(),
                       std::get<std::string>(response.result));
    }

    // Not logged in yet: the reply goes back over the stream the request
    // came in on
    reply(client, std::move(response), SendMode::Safe);
}

void server_runtime::end_session(const client_id &client, const std::string &reason) {
    auto it = m_sessions.find(client);
    if (it == m_sessions.end())
        return;
    std::string name = it->second.name;
    // Dropped first so callbacks below cannot end the same session again
    m_sessions.erase(it);

    {
        world::dispatch_scope scope(m_world);
        for (auto const &id : m_world.find_with<messenger>()) {
            if (auto *rpc = m_world.mut_module_of<messenger>(id))
                rpc->forget_client(client);
        }
        for (auto const &id : m_world.find_with<connection_listener>()) {
            if (auto *listener = m_world.mut_module_of<connection_listener>(id))
                listener->on_leave(id, m_world, client);
        }
    }

    m_transport.remove_client(client);
    m_logger->info("Client {} left ({}), {} online", name, reason, m_sessions.size());
    broadcast(server_msg::Logout{client, name}, client);
}

bool server_runtime::kick(const client_id &client, const std::string &reason) {
    if (m_sessions.count(client) == 0)
        return false;
    m_logger->info("Kicking {}: {}", client.to_string(), reason);
    reply(client, server_msg::Kick{reason}, SendMode::Safe);
    end_session(client, reason);
    return true;
}

void server_runtime::shutdown(const std::string &reason) {
    for (auto const &client : sessions()) {
        reply(client, server_msg::Unregister{reason}, SendMode::Safe);
        end_session(client, reason);
    }
}

void server_runtime::reply(const client_id &client, ServerMessage message, SendMode mode) {
    const char *name = message_name(message);
    auto result = m_transport.send(client, make_server_packet(std::move(message)), mode);
    if (result != SendResult::Ok)
        m_logger->warn("Couldn't send {} to {}: {}", name, client.to_string(), to_string(result));
}

void server_runtime::broadcast(const ServerMessage &message, const client_id &except) {
    for (auto const &[client, s] : m_sessions) {
        if (client != except)
            reply(client, message, SendMode::Safe);
    }
}

void server_runtime::expire_sessions(clock::time_point now) {
    auto timeout = std::chrono::milliseconds(m_config.client_timeout_ms);
    std::vector<client_id> expired;
    for (auto const &[client, s] : m_sessions) {
        if (now - s.last_seen > timeout)
            expired.push_back(client);
    }
    for (auto const &client : expired) {
        kick(client, "timed out");
    }
}

void server_runtime::send_keep_alives(clock::time_point now) {
    if (now - m_last_keep_alive < std::chrono::milliseconds(m_config.keep_alive_interval_ms))
        return;
    m_last_keep_alive = now;
    for (auto const &[client, s] : m_sessions) {
        reply(client, server_msg::KeepAlive{}, SendMode::Safe);
    }
}
