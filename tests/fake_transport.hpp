#pragma once

#include "i_client_transport.hpp"
#include "i_server_transport.hpp"
#include <cstddef>
#include <set>
#include <utility>
#include <variant>
#include <vector>

// Records sends and serves a scripted inbox instead of using sockets

class fake_server_transport : public i_server_transport {
public:
  struct sent_packet {
    client_id client;
    ServerPacket packet;
    SendMode mode;
  };

  std::vector<ServerInboxEntry> drain() override {
    std::vector<ServerInboxEntry> drained;
    drained.swap(inbox);
    return drained;
  }

  bool register_client(const client_id &client) override {
    return clients.insert(client).second;
  }
  bool remove_client(const client_id &client) override {
    streams.erase(client);
    return clients.erase(client) > 0;
  }
  bool has_client(const client_id &client) const override { return clients.count(client) > 0; }
  std::vector<client_id> client_ids() const override {
    return std::vector<client_id>(clients.begin(), clients.end());
  }

  // Like the socket transport, a bound stream is enough for a safe send
  SendResult send(const client_id &client, const ServerPacket &packet, SendMode mode) override {
    bool reachable = has_client(client) || (mode == SendMode::Safe && streams.count(client) > 0);
    if (!reachable)
      return SendResult::UnknownClient;
    sent.push_back(sent_packet{client, packet, mode});
    return SendResult::Ok;
  }

  void receive(const client_id &client, ClientMessage message, SendMode mode = SendMode::Safe) {
    receive_packet(make_client_packet(client, std::move(message)), mode);
  }

  // Reply carrying the conversation id of an earlier server packet
  void receive_reply(const client_id &client, const conv_id &conversation,
                     ClientMessage message, SendMode mode = SendMode::Safe) {
    ClientPacket packet = make_client_packet(client, std::move(message));
    packet.conversation = conversation;
    receive_packet(std::move(packet), mode);
  }

  void receive_packet(ClientPacket packet, SendMode mode) {
    if (mode == SendMode::Safe)
      streams.insert(packet.client);
    inbox.push_back(ReceivedPacket{std::move(packet), mode, {}});
  }

  // Sent messages of one kind, in send order
  template <typename T> std::vector<std::pair<client_id, T>> sent_of() const {
    std::vector<std::pair<client_id, T>> found;
    for (auto const &s : sent) {
      if (auto *message = std::get_if<T>(&s.packet.message))
        found.emplace_back(s.client, *message);
    }
    return found;
  }

  template <typename T> std::size_t count_of() const { return sent_of<T>().size(); }

  std::set<client_id> clients;
  // Clients that sent something over the safe channel
  std::set<client_id> streams;
  std::vector<sent_packet> sent;
  std::vector<ServerInboxEntry> inbox;
};

class fake_client_transport : public i_client_transport {
public:
  struct sent_packet {
    ClientPacket packet;
    SendMode mode;
  };

  std::vector<ClientInboxEntry> drain() override {
    std::vector<ClientInboxEntry> drained;
    drained.swap(inbox);
    return drained;
  }

  SendResult send(const ClientPacket &packet, SendMode mode) override {
    sent.push_back(sent_packet{packet, mode});
    return SendResult::Ok;
  }

  ConnectionState state() const override { return connection; }

  void receive(ServerMessage message) { inbox.push_back(make_server_packet(std::move(message))); }

  template <typename T> std::vector<T> sent_of() const {
    std::vector<T> found;
    for (auto const &s : sent) {
      if (auto *message = std::get_if<T>(&s.packet.message))
        found.push_back(*message);
    }
    return found;
  }

  ConnectionState connection = ConnectionState::Connected;
  std::vector<sent_packet> sent;
  std::vector<ClientInboxEntry> inbox;
};
