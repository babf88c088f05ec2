#pragma once

#include "i_client_transport.hpp"
#include "id.hpp"
#include "net_types.hpp"
#include "packets.hpp"
#include "rpc.hpp"
#include "wire_format.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

// RPC endpoint of one client handle: receives the server entity's calls
// and sends calls back to that entity's messenger
class client_messenger {
public:
  client_messenger(const entity_id &entity, handle_type_id handle_type,
                   const client_id &self, i_client_transport &transport,
                   std::shared_ptr<spdlog::logger> logger);

  client_messenger(const client_messenger &) = delete;
  client_messenger &operator=(const client_messenger &) = delete;

  // Handler signature: void(const Arg &)
  template <typename Arg, typename Handler>
  bool register_receiver(const RpcFn<Arg> &fn, Handler handler);
  template <typename Arg> bool unregister_receiver(const RpcFn<Arg> &fn) {
    return m_receivers.erase(fn.id()) > 0;
  }
  bool has_receiver(FunctionId function) const { return m_receivers.count(function) > 0; }

  template <typename Arg>
  SendResult call_server_fn(const RpcFn<Arg> &fn, const Arg &arg,
                            SendMode mode = SendMode::Safe);

  RouteResult dispatch(FunctionId function, const std::vector<std::uint8_t> &payload);

  const entity_id &entity() const { return m_entity; }
  handle_type_id handle_type() const { return m_handle_type; }
  const client_id &self() const { return m_self; }
  const std::shared_ptr<spdlog::logger> &logger() const { return m_logger; }

private:
  struct receiver {
    std::string name;
    std::function<void(const std::vector<std::uint8_t> &)> invoke;
  };

  bool insert_receiver(FunctionId function, std::string_view name,
                       std::function<void(const std::vector<std::uint8_t> &)> invoke);
  SendResult send(FunctionId function, std::string_view name,
                  std::vector<std::uint8_t> payload, SendMode mode);

  entity_id m_entity;
  handle_type_id m_handle_type;
  client_id m_self;
  i_client_transport &m_transport;
  std::shared_ptr<spdlog::logger> m_logger;
  std::map<FunctionId, receiver> m_receivers;
};

// Template function definitions
template <typename Arg, typename Handler>
bool client_messenger::register_receiver(const RpcFn<Arg> &fn, Handler handler) {
  std::function<void(const Arg &)> typed(std::move(handler));
  return insert_receiver(fn.id(), fn.name,
                         [typed](const std::vector<std::uint8_t> &payload) {
                           Arg arg = decode<Arg>(payload);
                           typed(arg);
                         });
}

template <typename Arg>
SendResult client_messenger::call_server_fn(const RpcFn<Arg> &fn, const Arg &arg,
                                            SendMode mode) {
  return send(fn.id(), fn.name, encode(arg), mode);
}
