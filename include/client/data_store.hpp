#pragma once

#include <cstddef>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

// Objects shared between client handles, one per type (caches, the chat
// log, whatever the embedding program hands to its handles)
class data_store {
public:
  template <typename T, typename Factory> T &get_or_create(Factory factory);
  template <typename T> T &get_or_create();
  template <typename T> T *get();
  template <typename T> bool remove();

  std::size_t size() const { return m_items.size(); }

private:
  std::unordered_map<std::type_index, std::shared_ptr<void>> m_items;
};

// Template function definitions
template <typename T, typename Factory> T &data_store::get_or_create(Factory factory) {
  std::type_index key(typeid(T));
  auto it = m_items.find(key);
  if (it == m_items.end())
    it = m_items.emplace(key, std::make_shared<T>(factory())).first;
  return *static_cast<T *>(it->second.get());
}

template <typename T> T &data_store::get_or_create() {
  return get_or_create<T>([] { return T{}; });
}

template <typename T> T *data_store::get() {
  auto it = m_items.find(std::type_index(typeid(T)));
  return it == m_items.end() ? nullptr : static_cast<T *>(it->second.get());
}

template <typename T> bool data_store::remove() {
  return m_items.erase(std::type_index(typeid(T))) > 0;
}
