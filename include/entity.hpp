#pragma once

#include "i_module.hpp"
#include "id.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

class world;

// An identified container of modules, keyed by the module's concrete type
class entity {
public:
  entity();
  explicit entity(const entity_id &id);
  ~entity();

  entity(const entity &) = delete;
  entity &operator=(const entity &) = delete;

  const entity_id &id() const { return m_id; }
  // Name given by world::tag_entity, empty when untagged
  const std::string &name() const { return m_name; }
  bool in_world() const { return m_world != nullptr && !m_removed; }

  // Returns nullptr, and drops the module, when a module of the same type
  // is already attached
  template <typename T> T *add_module(std::unique_ptr<T> module);
  template <typename T, typename... Args> T *emplace_module(Args &&...args);
  template <typename T> T *mut_module();
  template <typename T> const T *get_module() const;
  template <typename T> bool has_module() const;
  template <typename T> bool remove_module();

  std::size_t module_count() const { return m_modules.size(); }

private:
  friend class world;

  i_module *insert_module(std::type_index key, std::unique_ptr<i_module> module);
  i_module *find_module(std::type_index key) const;
  bool remove_module(std::type_index key);

  void start_modules();
  void tick_modules();

  entity_id m_id;
  std::string m_name;
  world *m_world = nullptr;
  bool m_removed = false;

  std::unordered_map<std::type_index, std::unique_ptr<i_module>> m_modules;
  // Registration order, drives start and tick order
  std::vector<std::type_index> m_order;
};

// Template function definitions
template <typename T> T *entity::add_module(std::unique_ptr<T> module) {
  static_assert(std::is_base_of_v<i_module, T>, "Modules must derive from i_module");
  if (!module)
    return nullptr;
  return static_cast<T *>(insert_module(std::type_index(typeid(T)), std::move(module)));
}

template <typename T, typename... Args> T *entity::emplace_module(Args &&...args) {
  return add_module(std::make_unique<T>(std::forward<Args>(args)...));
}

template <typename T> T *entity::mut_module() {
  return static_cast<T *>(find_module(std::type_index(typeid(T))));
}

template <typename T> const T *entity::get_module() const {
  return static_cast<const T *>(find_module(std::type_index(typeid(T))));
}

template <typename T> bool entity::has_module() const {
  return find_module(std::type_index(typeid(T))) != nullptr;
}

template <typename T> bool entity::remove_module() {
  return remove_module(std::type_index(typeid(T)));
}
