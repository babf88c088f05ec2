#pragma once

#include "i_module.hpp"
#include "i_server_transport.hpp"
#include "id.hpp"
#include "net_types.hpp"
#include "packets.hpp"
#include "rpc.hpp"
#include "wire_format.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

class world;

/*
 * RPC endpoint of one server entity.
 *
 * Clients subscribed with add_client get an AddClientHandle notification
 * and from then on receive every call_client_fn. Receivers registered
 * here are invoked for ModMessages that clients address to this entity.
 */
class messenger : public i_module {
public:
  enum class State { Idle, Active };

  // Receiver signature: (entity, world, sender, argument)
  template <typename Arg>
  using receiver_fn =
      std::function<void(const entity_id &, world &, const client_id &, const Arg &)>;

  explicit messenger(const HandleType &handle_type);

  void start(const entity_id &id, world &world) override;

  // Fails (with a warning) when the id is taken, including by a different
  // name hashing to the same id
  template <typename Arg, typename Handler>
  bool register_receiver(const RpcFn<Arg> &fn, Handler handler);
  template <typename Arg> bool unregister_receiver(const RpcFn<Arg> &fn) {
    return unregister_receiver(fn.id());
  }
  bool unregister_receiver(FunctionId function);
  bool has_receiver(FunctionId function) const;
  std::size_t receiver_count() const { return m_receivers.size(); }

  // Subscribes a client known to the transport; false if it was already
  // subscribed or is unknown
  bool add_client(const client_id &client);
  // Unsubscribes and tells the client to drop its handle
  bool remove_client(const client_id &client);
  // Unsubscribes without notifying (the client is gone)
  bool forget_client(const client_id &client);
  bool has_client(const client_id &client) const { return m_clients.count(client) > 0; }
  const std::set<client_id> &clients() const { return m_clients; }

  // Sends to every subscriber; returns how many sends were accepted
  template <typename Arg>
  std::size_t call_client_fn(const RpcFn<Arg> &fn, const Arg &arg,
                             SendMode mode = SendMode::Safe);
  // Sends to one client whether it is subscribed or not
  template <typename Arg>
  SendResult call_client_fn_for(const RpcFn<Arg> &fn, const client_id &client,
                                const Arg &arg, SendMode mode = SendMode::Safe);

  // Runs the receiver registered for function. Never throws: bad payloads,
  // unknown functions and failing receivers are reported in the result.
  RouteResult dispatch(world &world, const client_id &sender, FunctionId function,
                       const std::vector<std::uint8_t> &payload);

  State state() const;
  const entity_id &entity() const { return m_entity; }
  handle_type_id handle_type() const { return m_handle_type; }
  const std::string &handle_name() const { return m_handle_name; }

private:
  using raw_receiver = std::function<void(const entity_id &, world &, const client_id &,
                                          const std::vector<std::uint8_t> &)>;

  struct receiver {
    std::string name;
    raw_receiver invoke;
  };

  // Transport of the world the messenger started in, looked up per call
  i_server_transport *transport() const;
  void warn(std::string message);
  bool insert_receiver(FunctionId function, std::string_view name, raw_receiver invoke);
  std::size_t send_to_all(FunctionId function, std::string_view name,
                          const std::vector<std::uint8_t> &payload, SendMode mode);
  SendResult send_to(const client_id &client, FunctionId function, std::string_view name,
                     std::vector<std::uint8_t> payload, SendMode mode);

  handle_type_id m_handle_type;
  std::string m_handle_name;
  entity_id m_entity;
  world *m_world = nullptr;
  std::shared_ptr<spdlog::logger> m_logger;
  // Raised before start, when there is no logger yet
  std::vector<std::string> m_deferred_warnings;

  std::map<FunctionId, receiver> m_receivers;
  std::set<client_id> m_clients;
};

// Routes a client's ModMessage to the messenger of the addressed entity
RouteResult route_mod_message(world &game, const client_id &sender,
                              const client_msg::ModMessage &message);

// Template function definitions
template <typename Arg, typename Handler>
bool messenger::register_receiver(const RpcFn<Arg> &fn, Handler handler) {
  receiver_fn<Arg> typed(std::move(handler));
  return insert_receiver(
      fn.id(), fn.name,
      [typed](const entity_id &id, world &world, const client_id &sender,
              const std::vector<std::uint8_t> &payload) {
        Arg arg = decode<Arg>(payload);
        typed(id, world, sender, arg);
      });
}

template <typename Arg>
std::size_t messenger::call_client_fn(const RpcFn<Arg> &fn, const Arg &arg, SendMode mode) {
  if (m_clients.empty())
    return 0;
  return send_to_all(fn.id(), fn.name, encode(arg), mode);
}

template <typename Arg>
SendResult messenger::call_client_fn_for(const RpcFn<Arg> &fn, const client_id &client,
                                         const Arg &arg, SendMode mode) {
  return send_to(client, fn.id(), fn.name, encode(arg), mode);
}
