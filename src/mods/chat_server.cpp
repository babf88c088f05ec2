#include "mods/chat_mod.hpp"
#include "modules/connection_listener.hpp"
#include "modules/messenger.hpp"
#include "world.hpp"

std::string chat_name(const client_id &client) { return client.to_string().substr(0, 8); }

entity_id install_chat(world &game) {
    entity_id id = game.new_entity(CHAT_ENTITY_NAME);
    entity *chat = game.mut_entity(id);

    auto *rpc = chat->emplace_module<messenger>(CHAT_HANDLE);
    rpc->register_receiver(CHAT_SAY, [](const entity_id &id, world &world,
                                        const client_id &sender, const std::string &text) {
        if (text.empty())
            return;
        if (auto *self = world.mut_module_of<messenger>(id))
            self->call_client_fn(CHAT_LINE, chat_name(sender) + ": " + text);
    });

    chat->emplace_module<connection_listener>(
        [](const entity_id &id, world &world, const client_id &client) {
            auto *self = world.mut_module_of<messenger>(id);
            if (!self || !self->add_client(client))
                return;
            self->call_client_fn(CHAT_LINE, "user joined: " + chat_name(client));
        },
        [](const entity_id &id, world &world, const client_id &client) {
            auto *self = world.mut_module_of<messenger>(id);
            if (!self)
                return;
            self->remove_client(client);
            self->call_client_fn(CHAT_LINE, "user left: " + chat_name(client));
        });

    game.logger()->info("Chat installed on entity {}", id.to_string());
    return id;
}
