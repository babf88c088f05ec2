#pragma once

#include "entity.hpp"
#include "i_module.hpp"
#include "id.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

class i_server_transport;

/*
 * Entities of the server simulation and the hub modules use to reach each
 * other and the transport. Single threaded: only the game loop touches it.
 *
 * Entities and modules removed while a callback is running stay alive
 * until the outermost dispatch returns, but lookups stop finding them
 * immediately.
 */
class world {
public:
  explicit world(std::shared_ptr<spdlog::logger> logger);
  ~world();

  world(const world &) = delete;
  world &operator=(const world &) = delete;

  entity_id new_entity();
  entity_id new_entity(const std::string &name);
  // Takes ownership and starts the entity's modules. Returns nullptr when
  // an entity with the same id already exists.
  entity *add_entity(std::unique_ptr<entity> added);

  entity *mut_entity(const entity_id &id);
  const entity *get_entity(const entity_id &id) const;
  bool remove_entity(const entity_id &id);
  bool contains(const entity_id &id) const { return m_entities.count(id) > 0; }

  template <typename T> T *mut_module_of(const entity_id &id);
  template <typename T> const T *get_module_of(const entity_id &id) const;

  // Names are unique; fails when another entity holds the name
  bool tag_entity(const entity_id &id, const std::string &name);
  std::optional<entity_id> find_by_name(const std::string &name) const;
  template <typename T> std::vector<entity_id> find_with() const;

  // Insertion order
  std::vector<entity_id> ids() const { return m_order; }
  std::size_t size() const { return m_entities.size(); }

  // Runs tick on every module (entities in insertion order, modules in
  // registration order), then the tasks that are due
  void tick();

  // Deferred work. A task returns how many ticks to skip before it runs
  // again, or nullopt once it is finished.
  using task_fn = std::function<std::optional<std::uint64_t>(world &)>;
  // Runs fn on the tick after wait_ticks ticks have passed; 0 means the
  // next tick
  void queue_task(task_fn fn, std::uint64_t wait_ticks = 0);
  std::size_t task_count() const { return m_tasks.size(); }
  std::uint64_t tick_count() const { return m_tick_count; }

  i_server_transport *transport() const { return m_transport; }
  void set_transport(i_server_transport *transport) { m_transport = transport; }

  const std::shared_ptr<spdlog::logger> &logger() const { return m_logger; }

  // Marks a stretch of callbacks; removals inside it are deferred
  class dispatch_scope {
  public:
    explicit dispatch_scope(world &owner);
    ~dispatch_scope();

    dispatch_scope(const dispatch_scope &) = delete;
    dispatch_scope &operator=(const dispatch_scope &) = delete;

  private:
    world &m_world;
  };

private:
  friend class entity;

  struct scheduled_task {
    task_fn fn;
    std::uint64_t wait = 0;
  };

  void run_tasks();
  void start_module(const entity_id &id, i_module &module);
  void retire(std::unique_ptr<i_module> module);
  void flush_graveyard();

  std::shared_ptr<spdlog::logger> m_logger;
  i_server_transport *m_transport = nullptr;

  std::unordered_map<entity_id, std::unique_ptr<entity>> m_entities;
  std::vector<entity_id> m_order;
  std::map<std::string, entity_id> m_names;
  std::uint64_t m_tick_count = 0;
  std::vector<scheduled_task> m_tasks;

  int m_dispatch_depth = 0;
  std::vector<std::unique_ptr<entity>> m_dead_entities;
  std::vector<std::unique_ptr<i_module>> m_dead_modules;
};

// Template function definitions
template <typename T> T *world::mut_module_of(const entity_id &id) {
  entity *found = mut_entity(id);
  return found ? found->mut_module<T>() : nullptr;
}

template <typename T> const T *world::get_module_of(const entity_id &id) const {
  const entity *found = get_entity(id);
  return found ? found->get_module<T>() : nullptr;
}

template <typename T> std::vector<entity_id> world::find_with() const {
  std::vector<entity_id> found;
  for (auto const &id : m_order) {
    auto it = m_entities.find(id);
    if (it != m_entities.end() && it->second->has_module<T>())
      found.push_back(id);
  }
  return found;
}
