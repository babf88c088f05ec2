#pragma once

#include "client/i_client_handle.hpp"
#include "id.hpp"
#include "rpc.hpp"
#include <functional>
#include <string>
#include <vector>

class world;
class client_runtime;

// Demo mod: one "chat" entity relaying text lines between clients

inline constexpr RpcFn<std::string> CHAT_SAY{"chat.say"};   // client -> server
inline constexpr RpcFn<std::string> CHAT_LINE{"chat.line"}; // server -> clients
inline constexpr HandleType CHAT_HANDLE{"chat.handle"};
inline constexpr const char *CHAT_ENTITY_NAME = "chat";

// Lines seen by this client, kept in the data_store
struct chat_log {
  entity_id entity; // nil while not subscribed
  std::vector<std::string> lines;
};

// Creates the chat entity with its messenger and connection listener
entity_id install_chat(world &game);

class chat_handle : public i_client_handle {
public:
  using printer = std::function<void(const std::string &)>;

  explicit chat_handle(printer print);

  void start(client_messenger &messenger, data_store &store) override;
  void remove(client_messenger &messenger, data_store &store) override;

private:
  printer m_print;
};

void register_chat_handle(client_runtime &runtime, chat_handle::printer print);

// Short form of a client id used in chat lines
std::string chat_name(const client_id &client);
