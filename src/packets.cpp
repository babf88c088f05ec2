#include "packets.hpp"
#include <utility>

namespace client_msg {

void Ping::encode(WireWriter &writer) const { write(writer, text); }
Ping Ping::decode(WireReader &reader) { return Ping{read<std::string>(reader)}; }

void Pong::encode(WireWriter &writer) const { write(writer, text); }
Pong Pong::decode(WireReader &reader) { return Pong{read<std::string>(reader)}; }

void RawData::encode(WireWriter &writer) const { write(writer, bytes); }
RawData RawData::decode(WireReader &reader) {
    return RawData{read<std::vector<std::uint8_t>>(reader)};
}

void ModMessage::encode(WireWriter &writer) const {
    write(writer, entity);
    write(writer, function);
    write(writer, payload);
}

ModMessage ModMessage::decode(WireReader &reader) {
    ModMessage message;
    message.entity = read<entity_id>(reader);
    message.function = read<FunctionId>(reader);
    message.payload = read<std::vector<std::uint8_t>>(reader);
    return message;
}

void Register::encode(WireWriter &writer) const { write(writer, client_version); }
Register Register::decode(WireReader &reader) {
    return Register{read<std::string>(reader)};
}

void Acknowledge::encode(WireWriter &writer) const { write(writer, conversation); }
Acknowledge Acknowledge::decode(WireReader &reader) {
    return Acknowledge{read<conv_id>(reader)};
}

} // namespace client_msg

void ClientPacket::encode(WireWriter &writer) const {
    write(writer, client);
    write(writer, conversation);
    write(writer, message);
}

ClientPacket ClientPacket::decode(WireReader &reader) {
    ClientPacket packet;
    packet.client = read<client_id>(reader);
    packet.conversation = read<conv_id>(reader);
    packet.message = read<ClientMessage>(reader);
    return packet;
}

void ModInfo::encode(WireWriter &writer) const {
    write(writer, name);
    write(writer, flags);
    write(writer, hash);
    write(writer, size);
}

ModInfo ModInfo::decode(WireReader &reader) {
    ModInfo info;
    info.name = read<std::string>(reader);
    info.flags = read<std::vector<std::string>>(reader);
    info.hash = read<std::string>(reader);
    info.size = read<std::uint64_t>(reader);
    return info;
}

void ServerInfo::encode(WireWriter &writer) const {
    write(writer, server_version);
    write(writer, mod_profile);
    write(writer, mod_version);
    write(writer, mods);
}

ServerInfo ServerInfo::decode(WireReader &reader) {
    ServerInfo info;
    info.server_version = read<std::string>(reader);
    info.mod_profile = read<std::string>(reader);
    info.mod_version = read<std::string>(reader);
    info.mods = read<std::vector<ModInfo>>(reader);
    return info;
}

namespace server_msg {

void Acknowledge::encode(WireWriter &writer) const { write(writer, conversation); }
Acknowledge Acknowledge::decode(WireReader &reader) {
    return Acknowledge{read<conv_id>(reader)};
}

void Unregister::encode(WireWriter &writer) const { write(writer, reason); }
Unregister Unregister::decode(WireReader &reader) {
    return Unregister{read<std::string>(reader)};
}

void RegisterResponse::encode(WireWriter &writer) const { write(writer, result); }
RegisterResponse RegisterResponse::decode(WireReader &reader) {
    return RegisterResponse{read<std::variant<ServerInfo, std::string>>(reader)};
}

void Kick::encode(WireWriter &writer) const { write(writer, reason); }
Kick Kick::decode(WireReader &reader) { return Kick{read<std::string>(reader)}; }

void Login::encode(WireWriter &writer) const {
    write(writer, client);
    write(writer, name);
}

Login Login::decode(WireReader &reader) {
    Login message;
    message.client = read<client_id>(reader);
    message.name = read<std::string>(reader);
    return message;
}

void Logout::encode(WireWriter &writer) const {
    write(writer, client);
    write(writer, name);
}

Logout Logout::decode(WireReader &reader) {
    Logout message;
    message.client = read<client_id>(reader);
    message.name = read<std::string>(reader);
    return message;
}

void AddClientHandle::encode(WireWriter &writer) const {
    write(writer, entity);
    write(writer, handle_type);
}

AddClientHandle AddClientHandle::decode(WireReader &reader) {
    AddClientHandle message;
    message.entity = read<entity_id>(reader);
    message.handle_type = read<handle_type_id>(reader);
    return message;
}

void RemoveClientHandle::encode(WireWriter &writer) const { write(writer, entity); }
RemoveClientHandle RemoveClientHandle::decode(WireReader &reader) {
    return RemoveClientHandle{read<entity_id>(reader)};
}

} // namespace server_msg

void ServerPacket::encode(WireWriter &writer) const {
    write(writer, conversation);
    write(writer, message);
}

ServerPacket ServerPacket::decode(WireReader &reader) {
    ServerPacket packet;
    packet.conversation = read<conv_id>(reader);
    packet.message = read<ServerMessage>(reader);
    return packet;
}

ClientPacket make_client_packet(const client_id &client, ClientMessage message) {
    return ClientPacket{client, Id::generate(), std::move(message)};
}

ServerPacket make_server_packet(ServerMessage message) {
    return ServerPacket{Id::generate(), std::move(message)};
}

namespace {

struct ClientMessageName {
    const char *operator()(const client_msg::Login &) const { return "Login"; }
    const char *operator()(const client_msg::Logout &) const { return "Logout"; }
    const char *operator()(const client_msg::Ping &) const { return "Ping"; }
    const char *operator()(const client_msg::Pong &) const { return "Pong"; }
    const char *operator()(const client_msg::RawData &) const { return "RawData"; }
    const char *operator()(const client_msg::ModMessage &) const { return "ModMessage"; }
    const char *operator()(const client_msg::Register &) const { return "Register"; }
    const char *operator()(const client_msg::Acknowledge &) const { return "Acknowledge"; }
};

struct ServerMessageName {
    const char *operator()(const server_msg::KeepAlive &) const { return "KeepAlive"; }
    const char *operator()(const server_msg::Acknowledge &) const { return "Acknowledge"; }
    const char *operator()(const server_msg::Unregister &) const { return "Unregister"; }
    const char *operator()(const server_msg::RegisterResponse &) const {
        return "RegisterResponse";
    }
    const char *operator()(const server_msg::Kick &) const { return "Kick"; }
    const char *operator()(const server_msg::Login &) const { return "Login"; }
    const char *operator()(const server_msg::Logout &) const { return "Logout"; }
    const char *operator()(const server_msg::Ping &) const { return "Ping"; }
    const char *operator()(const server_msg::Pong &) const { return "Pong"; }
    const char *operator()(const server_msg::RawData &) const { return "RawData"; }
    const char *operator()(const server_msg::ModMessage &) const { return "ModMessage"; }
    const char *operator()(const server_msg::AddClientHandle &) const {
        return "AddClientHandle";
    }
    const char *operator()(const server_msg::RemoveClientHandle &) const {
        return "RemoveClientHandle";
    }
};

} // namespace

const char *message_name(const ClientMessage &message) {
    return std::visit(ClientMessageName{}, message);
}

const char *message_name(const ServerMessage &message) {
    return std::visit(ServerMessageName{}, message);
}
