#include "client/client_runtime.hpp"
#include "fake_transport.hpp"
#include "log.hpp"
#include "modules/connection_listener.hpp"
#include "modules/messenger.hpp"
#include "server_runtime.hpp"
#include <doctest/doctest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

constexpr RpcFn<std::string> ECHO{"test.echo"};
const HandleType ECHO_HANDLE{"test.echo_handle"};

struct runtime_fixture {
  runtime_fixture() : runtime(make_config(), transport, make_null_logger("runtime")) {}

  static ServerConfig make_config() {
    ServerConfig config;
    config.client_timeout_ms = 1000;
    config.keep_alive_interval_ms = 200;
    config.server_version = "1.2.3";
    return config;
  }

  client_id login(std::chrono::steady_clock::time_point at) {
    client_id client = Id::generate();
    transport.receive(client, client_msg::Login{});
    runtime.tick(at);
    return client;
  }

  fake_server_transport transport;
  server_runtime runtime;
  std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();
};

} // namespace

TEST_SUITE("server runtime") {

TEST_CASE_FIXTURE(runtime_fixture, "login registers and acknowledges") {
  client_id client = Id::generate();
  transport.receive(client, client_msg::Login{});
  conv_id conversation = std::get<ReceivedPacket>(transport.inbox.back()).packet.conversation;
  runtime.tick(t0);

  CHECK(runtime.has_session(client));
  CHECK(transport.has_client(client));
  auto acks = transport.sent_of<server_msg::Acknowledge>();
  REQUIRE(acks.size() == 1);
  CHECK(acks[0].second.conversation == conversation);
}

TEST_CASE_FIXTURE(runtime_fixture, "other clients hear about logins and logouts") {
  client_id first = login(t0);
  transport.sent.clear();
  client_id second = login(t0);

  auto joined = transport.sent_of<server_msg::Login>();
  REQUIRE(joined.size() == 1);
  CHECK(joined[0].first == first);
  CHECK(joined[0].second.client == second);

  transport.sent.clear();
  transport.receive(second, client_msg::Logout{});
  runtime.tick(t0);

  CHECK_FALSE(runtime.has_session(second));
  CHECK_FALSE(transport.has_client(second));
  auto left = transport.sent_of<server_msg::Logout>();
  REQUIRE(left.size() == 1);
  CHECK(left[0].first == first);
  CHECK(left[0].second.client == second);
}

TEST_CASE_FIXTURE(runtime_fixture, "ping is answered with pong on the same channel") {
  client_id client = login(t0);
  transport.sent.clear();

  transport.receive(client, client_msg::Ping{"are you there"}, SendMode::Quick);
  runtime.tick(t0);

  auto pongs = transport.sent_of<server_msg::Pong>();
  REQUIRE(pongs.size() == 1);
  CHECK(pongs[0].second.text == "are you there");
  CHECK(transport.sent.back().mode == SendMode::Quick);
}

TEST_CASE_FIXTURE(runtime_fixture, "packets from strangers are dropped") {
  client_id stranger = Id::generate();
  transport.receive(stranger, client_msg::Ping{"hi"});
  runtime.tick(t0);

  CHECK_FALSE(runtime.has_session(stranger));
  CHECK(transport.sent.empty());
}

TEST_CASE_FIXTURE(runtime_fixture, "register answers with server info or a refusal") {
  client_id client = Id::generate();
  transport.receive(client, client_msg::Register{"1.2.3"});
  transport.receive(client, client_msg::Register{"0.0.1"});
  runtime.tick(t0);

  auto responses = transport.sent_of<server_msg::RegisterResponse>();
  REQUIRE(responses.size() == 2);
  auto *info = std::get_if<ServerInfo>(&responses[0].second.result);
  REQUIRE(info != nullptr);
  CHECK(info->server_version == "1.2.3");
  CHECK(std::holds_alternative<std::string>(responses[1].second.result));
  // Registering is not logging in
  CHECK_FALSE(runtime.has_session(client));
  CHECK_FALSE(transport.has_client(client));
}

TEST_CASE_FIXTURE(runtime_fixture, "silent clients time out") {
  client_id quiet = login(t0);
  client_id chatty = login(t0);

  transport.receive(chatty, client_msg::Ping{"still here"});
  runtime.tick(t0 + 900ms);
  transport.sent.clear();
  runtime.tick(t0 + 1500ms);

  CHECK_FALSE(runtime.has_session(quiet));
  CHECK(runtime.has_session(chatty));
  auto kicks = transport.sent_of<server_msg::Kick>();
  REQUIRE(kicks.size() == 1);
  CHECK(kicks[0].first == quiet);
  CHECK(kicks[0].second.reason == "timed out");
}

TEST_CASE_FIXTURE(runtime_fixture, "keep-alives follow the interval") {
  client_id client = login(t0);
  CHECK(transport.count_of<server_msg::KeepAlive>() == 1);

  runtime.tick(t0 + 100ms);
  CHECK(transport.count_of<server_msg::KeepAlive>() == 1);
  runtime.tick(t0 + 250ms);
  CHECK(transport.count_of<server_msg::KeepAlive>() == 2);
  CHECK(transport.sent_of<server_msg::KeepAlive>().back().first == client);
}

TEST_CASE_FIXTURE(runtime_fixture, "lost connection ends the session") {
  client_id client = login(t0);
  transport.inbox.push_back(ConnectionEvent{client, ConnectionState::Disconnected, "reset"});
  runtime.tick(t0);
  CHECK_FALSE(runtime.has_session(client));
}

TEST_CASE_FIXTURE(runtime_fixture, "listeners and messengers follow the session") {
  world &game = runtime.game_world();
  entity_id id = game.new_entity("echo");
  auto *rpc = game.mut_entity(id)->emplace_module<messenger>(ECHO_HANDLE);
  std::vector<client_id> joined;
  std::vector<client_id> left;
  game.mut_entity(id)->emplace_module<connection_listener>(
      [&](const entity_id &self, world &w, const client_id &client) {
        joined.push_back(client);
        w.mut_module_of<messenger>(self)->add_client(client);
      },
      [&](const entity_id &, world &, const client_id &client) { left.push_back(client); });

  client_id client = login(t0);
  CHECK(joined == std::vector<client_id>{client});
  CHECK(rpc->has_client(client));

  transport.receive(client, client_msg::Logout{});
  runtime.tick(t0);
  CHECK(left == std::vector<client_id>{client});
  CHECK_FALSE(rpc->has_client(client));
}

TEST_CASE_FIXTURE(runtime_fixture, "mod messages reach the receiver") {
  world &game = runtime.game_world();
  entity_id id = game.new_entity();
  auto *rpc = game.mut_entity(id)->emplace_module<messenger>(ECHO_HANDLE);
  rpc->register_receiver(ECHO, [](const entity_id &self, world &w, const client_id &sender,
                                  const std::string &text) {
    w.mut_module_of<messenger>(self)->call_client_fn_for(ECHO, sender, text);
  });

  client_id client = login(t0);
  transport.sent.clear();
  transport.receive(client, client_msg::ModMessage{id, ECHO.id(), encode(std::string("ok"))});
  transport.receive(client, client_msg::ModMessage{Id::generate(), ECHO.id(), {}});
  runtime.tick(t0);

  auto replies = transport.sent_of<server_msg::ModMessage>();
  REQUIRE(replies.size() == 1);
  CHECK(replies[0].first == client);
  CHECK(decode<std::string>(replies[0].second.payload) == "ok");
}

TEST_CASE_FIXTURE(runtime_fixture, "kick and shutdown") {
  client_id a = login(t0);
  client_id b = login(t0);

  CHECK(runtime.kick(a, "cheating"));
  CHECK_FALSE(runtime.kick(a, "again"));
  CHECK(runtime.session_count() == 1);

  runtime.shutdown("maintenance");
  CHECK(runtime.session_count() == 0);
  auto goodbyes = transport.sent_of<server_msg::Unregister>();
  REQUIRE(goodbyes.size() == 1);
  CHECK(goodbyes[0].first == b);
}

TEST_CASE_FIXTURE(runtime_fixture, "request runs the handler for the matching reply only") {
  client_id client = login(t0);
  std::vector<std::string> answers;
  auto result = runtime.request(client, server_msg::Ping{"there?"},
                                [&](server_runtime &, const ClientPacket &packet) {
                                  answers.push_back(std::get<client_msg::Pong>(packet.message).text);
                                });
  REQUIRE(result == SendResult::Ok);
  CHECK(runtime.pending_replies(client) == 1);
  conv_id conversation = transport.sent.back().packet.conversation;

  transport.receive(client, client_msg::Pong{"unrelated"});
  transport.receive_reply(client, conversation, client_msg::Pong{"yes"});
  transport.receive_reply(client, conversation, client_msg::Pong{"again"});
  runtime.tick(t0);

  CHECK(answers == std::vector<std::string>{"yes"});
  CHECK(runtime.pending_replies(client) == 0);
}

TEST_CASE_FIXTURE(runtime_fixture, "pending replies go with the session") {
  client_id client = login(t0);
  bool called = false;
  REQUIRE(runtime.request(client, server_msg::KeepAlive{},
                          [&](server_runtime &, const ClientPacket &) { called = true; }) ==
          SendResult::Ok);
  conv_id conversation = transport.sent.back().packet.conversation;

  runtime.kick(client, "bye");
  CHECK(runtime.pending_replies(client) == 0);
  transport.receive_reply(client, conversation, client_msg::Acknowledge{conversation});
  runtime.tick(t0);
  CHECK_FALSE(called);

  CHECK(runtime.request(Id::generate(), server_msg::KeepAlive{}, nullptr) ==
        SendResult::UnknownClient);
}

TEST_CASE_FIXTURE(runtime_fixture, "failing reply handler keeps the session") {
  client_id client = login(t0);
  runtime.request(client, server_msg::Ping{"x"}, [](server_runtime &, const ClientPacket &) {
    throw std::runtime_error("bad reply");
  });
  conv_id conversation = transport.sent.back().packet.conversation;
  transport.sent.clear();

  transport.receive_reply(client, conversation, client_msg::Ping{"after"});
  runtime.tick(t0);

  CHECK(runtime.has_session(client));
  auto pongs = transport.sent_of<server_msg::Pong>();
  REQUIRE(pongs.size() == 1);
  CHECK(pongs[0].second.text == "after");
}

TEST_CASE("an idle client keeps its session through keep-alives") {
  fake_server_transport server_link;
  fake_client_transport client_link;
  server_runtime server(ServerConfig{}, server_link, make_null_logger("server"));
  client_runtime client(client_link, make_null_logger("client"));

  auto relay = [&] {
    for (auto const &s : client_link.sent) {
      server_link.receive_packet(s.packet, s.mode);
    }
    client_link.sent.clear();
    for (auto const &s : server_link.sent) {
      if (s.client == client.id())
        client_link.inbox.push_back(s.packet);
    }
    server_link.sent.clear();
  };

  auto start = std::chrono::steady_clock::now();
  REQUIRE(client.login() == SendResult::Ok);
  relay();
  server.tick(start);
  relay();
  client.tick(0.f);
  REQUIRE(client.state() == ConnectionState::Connected);

  // Nothing but keep-alive traffic, well past the client timeout
  for (int second = 1; second <= 12; ++second) {
    relay();
    server.tick(start + std::chrono::seconds(second));
    relay();
    client.tick(1.f);
  }
  CHECK(server.has_session(client.id()));
  CHECK(client.state() == ConnectionState::Connected);

  std::vector<std::string> answers;
  REQUIRE(server.request(client.id(), server_msg::Ping{"still there?"},
                         [&](server_runtime &, const ClientPacket &packet) {
                           if (auto *pong = std::get_if<client_msg::Pong>(&packet.message))
                             answers.push_back(pong->text);
                         }) == SendResult::Ok);
  relay();
  client.tick(0.f);
  relay();
  server.tick(start + std::chrono::seconds(13));
  CHECK(answers == std::vector<std::string>{"still there?"});
}

} // TEST_SUITE
