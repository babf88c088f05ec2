#include "world.hpp"
#include <algorithm>
#include <exception>
#include <utility>

world::world(std::shared_ptr<spdlog::logger> logger) : m_logger(std::move(logger)) {}

world::~world() = default;

entity_id world::new_entity() {
    auto created = std::make_unique<entity>();
    while (m_entities.count(created->id()) > 0) {
        created = std::make_unique<entity>();
    }
    return add_entity(std::move(created))->id();
}

entity_id world::new_entity(const std::string &name) {
    entity_id id = new_entity();
    tag_entity(id, name);
    return id;
}

entity *world::add_entity(std::unique_ptr<entity> added) {
    if (!added)
        return nullptr;
    entity_id id = added->id();
    if (m_entities.count(id) > 0) {
        m_logger->warn("Entity {} already exists", id.to_string());
        return nullptr;
    }

    entity *raw = added.get();
    raw->m_world = this;
    raw->m_removed = false;
    m_entities.emplace(id, std::move(added));
    m_order.push_back(id);
    m_logger->debug("Entity {} added", id.to_string());

    dispatch_scope scope(*this);
    raw->start_modules();
    return raw;
}

entity *world::mut_entity(const entity_id &id) {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : it->second.get();
}

const entity *world::get_entity(const entity_id &id) const {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : it->second.get();
}

bool world::remove_entity(const entity_id &id) {
    auto it = m_entities.find(id);
    if (it == m_entities.end())
        return false;

    std::unique_ptr<entity> removed = std::move(it->second);
    m_entities.erase(it);
    m_order.erase(std::find(m_order.begin(), m_order.end(), id));
    if (!removed->m_name.empty())
        m_names.erase(removed->m_name);
    removed->m_removed = true;
    m_logger->debug("Entity {} removed", id.to_string());

    if (m_dispatch_depth > 0)
        m_dead_entities.push_back(std::move(removed));
    return true;
}

bool world::tag_entity(const entity_id &id, const std::string &name) {
    entity *tagged = mut_entity(id);
    if (!tagged)
        return false;

    auto holder = m_names.find(name);
    if (holder != m_names.end() && holder->second != id) {
        m_logger->warn("Name '{}' is already used by entity {}", name,
                       holder->second.to_string());
        return false;
    }

    if (!tagged->m_name.empty())
        m_names.erase(tagged->m_name);
    tagged->m_name = name;
    if (!name.empty())
        m_names[name] = id;
    return true;
}

std::optional<entity_id> world::find_by_name(const std::string &name) const {
    auto it = m_names.find(name);
    if (it == m_names.end())
        return std::nullopt;
    return it->second;
}

void world::tick() {
    dispatch_scope scope(*this);
    std::vector<entity_id> order = m_order;
    for (auto const &id : order) {
        if (entity *ticked = mut_entity(id))
            ticked->tick_modules();
    }
    run_tasks();
    ++m_tick_count;
}

void world::queue_task(task_fn fn, std::uint64_t wait_ticks) {
    if (!fn)
        return;
    m_tasks.push_back(scheduled_task{std::move(fn), wait_ticks});
}

void world::run_tasks() {
    // Tasks queued while these run wait for the next tick
    std::vector<scheduled_task> due = std::move(m_tasks);
    m_tasks.clear();

    std::vector<scheduled_task> kept;
    for (auto &scheduled : due) {
        if (scheduled.wait > 0) {
            --scheduled.wait;
            kept.push_back(std::move(scheduled));
            continue;
        }

        std::optional<std::uint64_t> again;
        try {
            again = scheduled.fn(*this);
        } catch (const std::exception &e) {
            m_logger->error("Task dropped after it failed: {}", e.what());
        }
        if (again) {
            scheduled.wait = *again;
            kept.push_back(std::move(scheduled));
        }
    }

    for (auto &queued : m_tasks) {
        kept.push_back(std::move(queued));
    }
    m_tasks = std::move(kept);
}

void world::start_module(const entity_id &id, i_module &module) {
    dispatch_scope scope(*this);
    module.start(id, *this);
}

void world::retire(std::unique_ptr<i_module> module) {
    if (m_dispatch_depth > 0)
        m_dead_modules.push_back(std::move(module));
}

void world::flush_graveyard() {
    // Destructors may remove more things; keep going until nothing is left
    while (!m_dead_entities.empty() || !m_dead_modules.empty()) {
        auto entities = std::move(m_dead_entities);
        auto modules = std::move(m_dead_modules);
        m_dead_entities.clear();
        m_dead_modules.clear();
    }
}

world::dispatch_scope::dispatch_scope(world &owner) : m_world(owner) {
    ++m_world.m_dispatch_depth;
}

world::dispatch_scope::~dispatch_scope() {
    if (--m_world.m_dispatch_depth == 0)
        m_world.flush_graveyard();
}
