#include "mods/chat_mod.hpp"
#include "client/client_messenger.hpp"
#include "client/client_runtime.hpp"
#include "client/data_store.hpp"
#include <memory>
#include <utility>

chat_handle::chat_handle(printer print) : m_print(std::move(print)) {}

void chat_handle::start(client_messenger &messenger, data_store &store) {
    auto &history = store.get_or_create<chat_log>();
    history.entity = messenger.entity();
    messenger.register_receiver(CHAT_LINE, [this, &history](const std::string &line) {
        history.lines.push_back(line);
        if (m_print)
            m_print(line);
    });
    messenger.logger()->info("Joined chat on entity {}", messenger.entity().to_string());
}

void chat_handle::remove(client_messenger &messenger, data_store &store) {
    messenger.unregister_receiver(CHAT_LINE);
    if (auto *history = store.get<chat_log>())
        history->entity = Id::nil();
}

void register_chat_handle(client_runtime &runtime, chat_handle::printer print) {
    runtime.register_handle(CHAT_HANDLE, [print] { return std::make_unique<chat_handle>(print); });
}
