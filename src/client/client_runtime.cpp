#include "client/client_runtime.hpp"
#include <utility>
#include <variant>
#include <vector>

client_runtime::client_runtime(i_client_transport &transport,
                               std::shared_ptr<spdlog::logger> logger, const client_id &self)
    : m_transport(transport), m_logger(std::move(logger)), m_self(self) {}

client_runtime::~client_runtime() = default;

bool client_runtime::register_handle(const HandleType &type, handle_factory factory) {
    auto inserted = m_types.emplace(type.id(), registered_type{std::string(type.name),
                                                               std::move(factory)});
    if (!inserted.second) {
        m_logger->warn("Handle type '{}' is already registered", type.name);
        return false;
    }
    return true;
}

SendResult client_runtime::send(ClientMessage message, SendMode mode) {
    const char *name = message_name(message);
    auto result = m_transport.send(make_client_packet(m_self, std::move(message)), mode);
    if (result != SendResult::Ok)
        m_logger->warn("Couldn't send {}: {}", name, to_string(result));
    return result;
}

SendResult client_runtime::reply(const conv_id &conversation, ClientMessage message,
                                  SendMode mode) {
    const char *name = message_name(message);
    ClientPacket packet = make_client_packet(m_self, std::move(message));
    packet.conversation = conversation;
    auto result = m_transport.send(packet, mode);
    if (result != SendResult::Ok)
        m_logger->warn("Couldn't send {}: {}", name, to_string(result));
    return result;
}

SendResult client_runtime::send_register(const std::string &client_version) {
    return send(client_msg::Register{client_version}, SendMode::Safe);
}

SendResult client_runtime::login() {
    auto packet = make_client_packet(m_self, client_msg::Login{});
    m_login_conversation = packet.conversation;
    m_state = ConnectionState::Connecting;
    auto result = m_transport.send(packet, SendMode::Safe);
    if (result != SendResult::Ok)
        m_logger->error("Couldn't send login: {}", to_string(result));
    return result;
}

SendResult client_runtime::logout() {
    auto result = send(client_msg::Logout{}, SendMode::Safe);
    disconnect("logged out");
    return result;
}

SendResult client_runtime::ping(const std::string &text) {
    return send(client_msg::Ping{text}, SendMode::Safe);
}

client_messenger *client_runtime::messenger_for(const entity_id &entity) {
    auto it = m_handles.find(entity);
    return it == m_handles.end() ? nullptr : it->second.messenger.get();
}

void client_runtime::tick(float dt) {
    for (auto &entry : m_transport.drain()) {
        if (auto *packet = std::get_if<ServerPacket>(&entry))
            handle_packet(*packet);
        else
            handle_event(std::get<ConnectionEvent>(entry));
    }

    // Snapshot: an update may lead to a handle being dropped
    std::vector<entity_id> entities;
    entities.reserve(m_handles.size());
    for (auto const &[entity, entry] : m_handles) {
        entities.push_back(entity);
    }
    for (auto const &entity : entities) {
        auto it = m_handles.find(entity);
        if (it != m_handles.end())
            it->second.handle->update(*it->second.messenger, m_store, dt);
    }
}

void client_runtime::handle_packet(const ServerPacket &packet) {
    const ServerMessage &message = packet.message;
    m_logger->trace("{} from server", message_name(message));

    if (auto *ack = std::get_if<server_msg::Acknowledge>(&message)) {
        if (m_login_conversation && ack->conversation == *m_login_conversation &&
            m_state == ConnectionState::Connecting) {
            m_state = ConnectionState::Connected;
            m_logger->info("Logged in as {}", m_self.to_string());
            // The server learns our datagram endpoint from the first quick
            // packet after it registered us
            send(client_msg::Ping{"hello"}, SendMode::Quick);
        }
    } else if (auto *mod = std::get_if<server_msg::ModMessage>(&message)) {
        auto *target = messenger_for(mod->entity);
        if (!target) {
            m_logger->error("Message for entity {} without a handle", mod->entity.to_string());
            return;
        }
        target->dispatch(mod->function, mod->payload);
    } else if (auto *add = std::get_if<server_msg::AddClientHandle>(&message)) {
        add_handle(add->entity, add->handle_type);
    } else if (auto *removed = std::get_if<server_msg::RemoveClientHandle>(&message)) {
        remove_handle(removed->entity);
    } else if (auto *kick = std::get_if<server_msg::Kick>(&message)) {
        m_logger->warn("Kicked by server: {}", kick->reason);
        disconnect(kick->reason);
    } else if (auto *unregister = std::get_if<server_msg::Unregister>(&message)) {
        m_logger->info("Server closed the session: {}", unregister->reason);
        disconnect(unregister->reason);
    } else if (auto *response = std::get_if<server_msg::RegisterResponse>(&message)) {
        if (auto *info = std::get_if<ServerInfo>(&response->result)) {
            m_server_info = *info;
            m_logger->info("Server version {}, mod profile '{}' ({} mods)", info->server_version,
                           info->mod_profile, info->mods.size());
        } else {
            m_logger->error("Registration refused: {}", std::get<std::string>(response->result));
        }
    } else if (auto *joined = std::get_if<server_msg::Login>(&message)) {
        m_peers.insert(joined->client);
        m_logger->info("{} joined", joined->name);
    } else if (auto *left = std::get_if<server_msg::Logout>(&message)) {
        m_peers.erase(left->client);
        m_logger->info("{} left", left->name);
    } else if (std::holds_alternative<server_msg::KeepAlive>(message)) {
        reply(packet.conversation, client_msg::Acknowledge{packet.conversation}, SendMode::Safe);
    } else if (auto *ping = std::get_if<server_msg::Ping>(&message)) {
        reply(packet.conversation, client_msg::Pong{ping->text}, SendMode::Safe);
    } else if (auto *pong = std::get_if<server_msg::Pong>(&message)) {
        m_logger->debug("Pong: {}", pong->text);
    } else if (auto *raw = std::get_if<server_msg::RawData>(&message)) {
        m_logger->debug("{} bytes of raw data from server", raw->bytes.size());
    }
}

void client_runtime::handle_event(const ConnectionEvent &event) {
    if (event.state == ConnectionState::Disconnected)
        disconnect(event.reason);
}

void client_runtime::add_handle(const entity_id &entity, const handle_type_id &type) {
    if (m_handles.count(entity) > 0) {
        m_logger->warn("Entity {} already has a handle", entity.to_string());
        return;
    }
    auto it = m_types.find(type);
    if (it == m_types.end()) {
        m_logger->error("Unknown handle type {} for entity {}", type.to_string(),
                        entity.to_string());
        return;
    }

    handle_entry entry;
    entry.messenger =
        std::make_unique<client_messenger>(entity, type, m_self, m_transport, m_logger);
    entry.handle = it->second.factory();
    if (!entry.handle) {
        m_logger->error("Factory for '{}' returned no handle", it->second.name);
        return;
    }

    auto &added = m_handles.emplace(entity, std::move(entry)).first->second;
    m_logger->debug("Added {} handle for entity {}", it->second.name, entity.to_string());
    added.handle->start(*added.messenger, m_store);
}

void client_runtime::remove_handle(const entity_id &entity) {
    auto it = m_handles.find(entity);
    if (it == m_handles.end()) {
        m_logger->warn("No handle to remove for entity {}", entity.to_string());
        return;
    }
    handle_entry entry = std::move(it->second);
    m_handles.erase(it);
    entry.handle->remove(*entry.messenger, m_store);
}

void client_runtime::disconnect(const std::string &reason) {
    if (m_state == ConnectionState::Disconnected)
        return;
    m_state = ConnectionState::Disconnected;
    m_disconnect_reason = reason;

    while (!m_handles.empty()) {
        remove_handle(m_handles.begin()->first);
    }
    m_peers.clear();
}
