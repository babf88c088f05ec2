#include "modules/messenger.hpp"
#include "world.hpp"
#include <exception>
#include <utility>

messenger::messenger(const HandleType &handle_type)
    : m_handle_type(handle_type.id()), m_handle_name(handle_type.name) {}

void messenger::start(const entity_id &id, world &world) {
    m_entity = id;
    m_world = &world;
    m_logger = world.logger();
    for (auto const &warning : m_deferred_warnings) {
        m_logger->warn("Messenger on entity {}: {}", id.to_string(), warning);
    }
    m_deferred_warnings.clear();
}

i_server_transport *messenger::transport() const {
    return m_world ? m_world->transport() : nullptr;
}

void messenger::warn(std::string message) {
    // Receivers are usually registered before the entity joins a world
    if (m_logger)
        m_logger->warn("Messenger on entity {}: {}", m_entity.to_string(), message);
    else
        m_deferred_warnings.push_back(std::move(message));
}

bool messenger::insert_receiver(FunctionId function, std::string_view name,
                                raw_receiver invoke) {
    auto it = m_receivers.find(function);
    if (it != m_receivers.end()) {
        if (it->second.name != name)
            warn(fmt::format("function id {:#018x} of '{}' collides with '{}'", function, name,
                             it->second.name));
        else
            warn(fmt::format("receiver '{}' is already registered", name));
        return false;
    }
    m_receivers.emplace(function, receiver{std::string(name), std::move(invoke)});
    return true;
}

bool messenger::unregister_receiver(FunctionId function) {
    return m_receivers.erase(function) > 0;
}

bool messenger::has_receiver(FunctionId function) const {
    return m_receivers.count(function) > 0;
}

bool messenger::add_client(const client_id &client) {
    i_server_transport *link = transport();
    if (!link || !link->has_client(client))
        return false;
    if (!m_clients.insert(client).second)
        return false;

    auto result = link->send(
        client, make_server_packet(server_msg::AddClientHandle{m_entity, m_handle_type}),
        SendMode::Safe);
    if (result != SendResult::Ok)
        m_logger->warn("Couldn't send {} handle for entity {} to {}: {}", m_handle_name,
                       m_entity.to_string(), client.to_string(), to_string(result));
    return true;
}

bool messenger::remove_client(const client_id &client) {
    if (m_clients.erase(client) == 0)
        return false;

    i_server_transport *link = transport();
    if (link && link->has_client(client)) {
        auto result = link->send(
            client, make_server_packet(server_msg::RemoveClientHandle{m_entity}),
            SendMode::Safe);
        if (result != SendResult::Ok)
            m_logger->warn("Couldn't remove handle for entity {} from {}: {}",
                           m_entity.to_string(), client.to_string(), to_string(result));
    }
    return true;
}

bool messenger::forget_client(const client_id &client) {
    return m_clients.erase(client) > 0;
}

std::size_t messenger::send_to_all(FunctionId function, std::string_view name,
                                   const std::vector<std::uint8_t> &payload, SendMode mode) {
    std::size_t accepted = 0;
    // Copy: a failed send must not disturb the subscriber set mid-loop
    std::vector<client_id> clients(m_clients.begin(), m_clients.end());
    for (auto const &client : clients) {
        if (send_to(client, function, name, payload, mode) == SendResult::Ok)
            ++accepted;
    }
    return accepted;
}

SendResult messenger::send_to(const client_id &client, FunctionId function,
                              std::string_view name, std::vector<std::uint8_t> payload,
                              SendMode mode) {
    i_server_transport *link = transport();
    if (!link)
        return SendResult::NotConnected;

    auto packet =
        make_server_packet(server_msg::ModMessage{m_entity, function, std::move(payload)});
    auto result = link->send(client, packet, mode);
    if (result != SendResult::Ok) {
        m_logger->warn("Call {} to client {} failed: {}", name, client.to_string(),
                       to_string(result));
    } else {
        m_logger->trace("Call {} to client {} ({})", name, client.to_string(), to_string(mode));
    }
    return result;
}

RouteResult messenger::dispatch(world &world, const client_id &sender, FunctionId function,
                                const std::vector<std::uint8_t> &payload) {
    auto it = m_receivers.find(function);
    if (it == m_receivers.end()) {
        world.logger()->error("No receiver {:#018x} on entity {} (from {})", function,
                              m_entity.to_string(), sender.to_string());
        return RouteResult::UnknownFunction;
    }

    // The receiver may unregister itself while running
    receiver called = it->second;
    try {
        called.invoke(m_entity, world, sender, payload);
    } catch (const DecodeError &e) {
        world.logger()->error("Bad arguments for {} on entity {} from {}: {}", called.name,
                              m_entity.to_string(), sender.to_string(), e.what());
        return RouteResult::DecodeFailed;
    } catch (const std::exception &e) {
        world.logger()->error("Receiver {} on entity {} failed for {}: {}", called.name,
                              m_entity.to_string(), sender.to_string(), e.what());
        return RouteResult::HandlerFailed;
    }
    return RouteResult::Delivered;
}

messenger::State messenger::state() const {
    return m_receivers.empty() && m_clients.empty() ? State::Idle : State::Active;
}

RouteResult route_mod_message(world &game, const client_id &sender,
                              const client_msg::ModMessage &message) {
    world::dispatch_scope scope(game);

    auto *target = game.mut_entity(message.entity);
    if (!target) {
        game.logger()->error("Message for unknown entity {} from {}",
                              message.entity.to_string(), sender.to_string());
        return RouteResult::UnknownEntity;
    }
    auto *rpc = target->mut_module<messenger>();
    if (!rpc) {
        game.logger()->error("Entity {} has no messenger (message from {})",
                              message.entity.to_string(), sender.to_string());
        return RouteResult::NoMessenger;
    }
    return rpc->dispatch(game, sender, message.function, message.payload);
}
