#pragma once

#include "i_module.hpp"
#include "id.hpp"
#include <functional>
#include <utility>

class world;

// Lets an entity react to clients logging in and out
class connection_listener : public i_module {
public:
  using callback = std::function<void(const entity_id &, world &, const client_id &)>;

  connection_listener() = default;
  connection_listener(callback on_join, callback on_leave);

  void set_on_join(callback on_join) { m_on_join = std::move(on_join); }
  void set_on_leave(callback on_leave) { m_on_leave = std::move(on_leave); }

  void on_join(const entity_id &id, world &world, const client_id &client);
  void on_leave(const entity_id &id, world &world, const client_id &client);

private:
  callback m_on_join;
  callback m_on_leave;
};
