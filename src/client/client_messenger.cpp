#include "client/client_messenger.hpp"
#include <exception>
#include <utility>

client_messenger::client_messenger(const entity_id &entity, handle_type_id handle_type,
                                   const client_id &self, i_client_transport &transport,
                                   std::shared_ptr<spdlog::logger> logger)
    : m_entity(entity), m_handle_type(handle_type), m_self(self), m_transport(transport),
      m_logger(std::move(logger)) {}

bool client_messenger::insert_receiver(
    FunctionId function, std::string_view name,
    std::function<void(const std::vector<std::uint8_t> &)> invoke) {
    auto it = m_receivers.find(function);
    if (it != m_receivers.end()) {
        m_logger->warn("Function id {:#018x} of '{}' is already taken by '{}'", function, name,
                       it->second.name);
        return false;
    }
    m_receivers.emplace(function, receiver{std::string(name), std::move(invoke)});
    return true;
}

SendResult client_messenger::send(FunctionId function, std::string_view name,
                                  std::vector<std::uint8_t> payload, SendMode mode) {
    auto packet =
        make_client_packet(m_self, client_msg::ModMessage{m_entity, function, std::move(payload)});
    auto result = m_transport.send(packet, mode);
    if (result != SendResult::Ok)
        m_logger->warn("Call {} on entity {} failed: {}", name, m_entity.to_string(),
                       to_string(result));
    return result;
}

RouteResult client_messenger::dispatch(FunctionId function,
                                       const std::vector<std::uint8_t> &payload) {
    auto it = m_receivers.find(function);
    if (it == m_receivers.end()) {
        m_logger->error("No receiver {:#018x} on handle for entity {}", function,
                        m_entity.to_string());
        return RouteResult::UnknownFunction;
    }

    receiver called = it->second;
    try {
        called.invoke(payload);
    } catch (const DecodeError &e) {
        m_logger->error("Bad arguments for {} on entity {}: {}", called.name,
                        m_entity.to_string(), e.what());
        return RouteResult::DecodeFailed;
    } catch (const std::exception &e) {
        m_logger->error("Receiver {} on entity {} failed: {}", called.name,
                        m_entity.to_string(), e.what());
        return RouteResult::HandlerFailed;
    }
    return RouteResult::Delivered;
}
