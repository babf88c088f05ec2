#include "entity.hpp"
#include "world.hpp"
#include <algorithm>

entity::entity() : m_id(Id::generate()) {}

entity::entity(const entity_id &id) : m_id(id) {}

entity::~entity() = default;

i_module *entity::insert_module(std::type_index key, std::unique_ptr<i_module> module) {
    if (m_modules.find(key) != m_modules.end()) {
        if (m_world)
            m_world->logger()->warn("Entity {} already has a {} module", m_id.to_string(),
                                    key.name());
        return nullptr;
    }

    i_module *raw = module.get();
    m_modules.emplace(key, std::move(module));
    m_order.push_back(key);

    if (in_world())
        m_world->start_module(m_id, *raw);
    return raw;
}

i_module *entity::find_module(std::type_index key) const {
    auto it = m_modules.find(key);
    return it == m_modules.end() ? nullptr : it->second.get();
}

bool entity::remove_module(std::type_index key) {
    auto it = m_modules.find(key);
    if (it == m_modules.end())
        return false;

    std::unique_ptr<i_module> module = std::move(it->second);
    m_modules.erase(it);
    m_order.erase(std::find(m_order.begin(), m_order.end(), key));

    // The module may be the one currently running a callback
    if (m_world)
        m_world->retire(std::move(module));
    return true;
}

void entity::start_modules() {
    // Snapshot: callbacks may add or remove modules
    std::vector<std::type_index> order = m_order;
    for (auto const &key : order) {
        if (!in_world())
            return;
        if (i_module *module = find_module(key))
            module->start(m_id, *m_world);
    }
}

void entity::tick_modules() {
    std::vector<std::type_index> order = m_order;
    for (auto const &key : order) {
        if (!in_world())
            return;
        if (i_module *module = find_module(key))
            module->tick(m_id, *m_world);
    }
}
