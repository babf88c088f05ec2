#include "modules/connection_listener.hpp"
#include <utility>

connection_listener::connection_listener(callback on_join, callback on_leave)
    : m_on_join(std::move(on_join)), m_on_leave(std::move(on_leave)) {}

void connection_listener::on_join(const entity_id &id, world &world, const client_id &client) {
    if (m_on_join)
        m_on_join(id, world, client);
}

void connection_listener::on_leave(const entity_id &id, world &world, const client_id &client) {
    if (m_on_leave)
        m_on_leave(id, world, client);
}
