#include "fake_transport.hpp"
#include "log.hpp"
#include "modules/messenger.hpp"
#include "world.hpp"
#include <doctest/doctest.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>

namespace {

constexpr RpcFn<std::string> SAY{"test.say"};
constexpr RpcFn<std::int32_t> MOVE{"test.move"};
const HandleType PANEL{"test.panel"};

struct messenger_fixture {
  messenger_fixture() : game(make_null_logger("messenger")) {
    game.set_transport(&transport);
    id = game.new_entity();
    rpc = game.mut_entity(id)->emplace_module<messenger>(PANEL);
  }

  client_id connect() {
    client_id client = Id::generate();
    transport.register_client(client);
    return client;
  }

  fake_server_transport transport;
  world game;
  entity_id id;
  messenger *rpc = nullptr;
};

} // namespace

TEST_SUITE("messenger") {

TEST_CASE("function ids come from the declared name") {
  CHECK(SAY.id() == function_id_of("test.say"));
  CHECK(SAY.id() != MOVE.id());
  static_assert(RpcFn<int>{"x"}.id() == fnv1a64("x"), "ids are computed at compile time");
}

TEST_CASE_FIXTURE(messenger_fixture, "starts idle and becomes active") {
  CHECK(rpc->state() == messenger::State::Idle);
  CHECK(rpc->entity() == id);
  CHECK(rpc->handle_type() == Id::from_name("test.panel"));

  rpc->register_receiver(SAY, [](const entity_id &, world &, const client_id &,
                                 const std::string &) {});
  CHECK(rpc->state() == messenger::State::Active);
  CHECK(rpc->unregister_receiver(SAY));
  CHECK(rpc->state() == messenger::State::Idle);
}

TEST_CASE_FIXTURE(messenger_fixture, "add_client twice sends one handle") {
  client_id client = connect();

  CHECK(rpc->add_client(client));
  CHECK_FALSE(rpc->add_client(client));
  CHECK(rpc->clients().size() == 1);

  auto handles = transport.sent_of<server_msg::AddClientHandle>();
  REQUIRE(handles.size() == 1);
  CHECK(handles[0].first == client);
  CHECK(handles[0].second.entity == id);
  CHECK(handles[0].second.handle_type == PANEL.id());
  CHECK(transport.sent[0].mode == SendMode::Safe);
  CHECK(rpc->state() == messenger::State::Active);
}

TEST_CASE_FIXTURE(messenger_fixture, "unknown clients cannot subscribe") {
  CHECK_FALSE(rpc->add_client(Id::generate()));
  CHECK(rpc->clients().empty());
  CHECK(transport.sent.empty());
}

TEST_CASE_FIXTURE(messenger_fixture, "remove_client notifies once") {
  client_id client = connect();
  rpc->add_client(client);

  CHECK(rpc->remove_client(client));
  CHECK_FALSE(rpc->remove_client(client));
  auto removed = transport.sent_of<server_msg::RemoveClientHandle>();
  REQUIRE(removed.size() == 1);
  CHECK(removed[0].second.entity == id);
  CHECK(rpc->state() == messenger::State::Idle);
}

TEST_CASE_FIXTURE(messenger_fixture, "call_client_fn fans out to every subscriber") {
  std::vector<client_id> clients{connect(), connect(), connect()};
  for (auto const &client : clients) {
    rpc->add_client(client);
  }
  transport.sent.clear();

  CHECK(rpc->call_client_fn(SAY, std::string("hello"), SendMode::Safe) == 3);

  auto calls = transport.sent_of<server_msg::ModMessage>();
  REQUIRE(calls.size() == 3);
  std::set<client_id> reached;
  for (auto const &[client, call] : calls) {
    reached.insert(client);
    CHECK(call.entity == id);
    CHECK(call.function == SAY.id());
    CHECK(call.payload == encode(std::string("hello")));
  }
  CHECK(reached == std::set<client_id>(clients.begin(), clients.end()));
}

TEST_CASE_FIXTURE(messenger_fixture, "no subscribers is a silent no-op") {
  CHECK(rpc->call_client_fn(SAY, std::string("anyone?")) == 0);
  CHECK(transport.sent.empty());
}

TEST_CASE_FIXTURE(messenger_fixture, "subscriber gone from the transport is a logged miss") {
  client_id stays = connect();
  client_id leaves = connect();
  rpc->add_client(stays);
  rpc->add_client(leaves);
  transport.remove_client(leaves);
  transport.sent.clear();

  CHECK(rpc->call_client_fn(MOVE, std::int32_t{4}, SendMode::Quick) == 1);
  auto calls = transport.sent_of<server_msg::ModMessage>();
  REQUIRE(calls.size() == 1);
  CHECK(calls[0].first == stays);
  CHECK(transport.sent[0].mode == SendMode::Quick);
}

TEST_CASE_FIXTURE(messenger_fixture, "call_client_fn_for ignores subscriptions") {
  client_id client = connect();
  CHECK(rpc->call_client_fn_for(SAY, client, std::string("welcome")) == SendResult::Ok);
  CHECK(rpc->clients().empty());
  CHECK(transport.count_of<server_msg::ModMessage>() == 1);

  CHECK(rpc->call_client_fn_for(SAY, Id::generate(), std::string("x")) ==
        SendResult::UnknownClient);
}

TEST_CASE_FIXTURE(messenger_fixture, "dispatch invokes the matching receiver once") {
  client_id sender = Id::generate();
  int calls = 0;
  std::string seen;
  client_id seen_sender;
  entity_id seen_entity;
  rpc->register_receiver(SAY, [&](const entity_id &entity, world &, const client_id &from,
                                  const std::string &text) {
    ++calls;
    seen = text;
    seen_sender = from;
    seen_entity = entity;
  });

  CHECK(rpc->dispatch(game, sender, SAY.id(), encode(std::string("hi"))) ==
        RouteResult::Delivered);
  CHECK(calls == 1);
  CHECK(seen == "hi");
  CHECK(seen_sender == sender);
  CHECK(seen_entity == id);
}

TEST_CASE_FIXTURE(messenger_fixture, "unknown function leaves state unchanged") {
  client_id client = connect();
  rpc->add_client(client);
  rpc->register_receiver(SAY, [](const entity_id &, world &, const client_id &,
                                 const std::string &) {});

  CHECK(rpc->dispatch(game, client, 0x1234, {}) == RouteResult::UnknownFunction);
  CHECK(rpc->receiver_count() == 1);
  CHECK(rpc->clients().size() == 1);
}

TEST_CASE_FIXTURE(messenger_fixture, "bad payload is reported, later messages still work") {
  int calls = 0;
  rpc->register_receiver(MOVE, [&](const entity_id &, world &, const client_id &,
                                   const std::int32_t &) { ++calls; });

  std::vector<std::uint8_t> truncated{1, 2};
  CHECK(rpc->dispatch(game, Id::generate(), MOVE.id(), truncated) == RouteResult::DecodeFailed);
  CHECK(rpc->dispatch(game, Id::generate(), MOVE.id(), encode(std::int32_t{3})) ==
        RouteResult::Delivered);
  CHECK(calls == 1);
}

TEST_CASE_FIXTURE(messenger_fixture, "duplicate registration is refused") {
  auto noop = [](const entity_id &, world &, const client_id &, const std::string &) {};
  CHECK(rpc->register_receiver(SAY, noop));
  CHECK_FALSE(rpc->register_receiver(SAY, noop));
  CHECK(rpc->receiver_count() == 1);
}

TEST_CASE_FIXTURE(messenger_fixture, "route_mod_message resolves entity and messenger") {
  int calls = 0;
  rpc->register_receiver(SAY, [&](const entity_id &, world &, const client_id &,
                                  const std::string &) { ++calls; });
  client_id sender = Id::generate();

  client_msg::ModMessage good{id, SAY.id(), encode(std::string("x"))};
  CHECK(route_mod_message(game, sender, good) == RouteResult::Delivered);

  client_msg::ModMessage lost{Id::generate(), SAY.id(), {}};
  CHECK(route_mod_message(game, sender, lost) == RouteResult::UnknownEntity);

  entity_id bare = game.new_entity();
  client_msg::ModMessage no_rpc{bare, SAY.id(), {}};
  CHECK(route_mod_message(game, sender, no_rpc) == RouteResult::NoMessenger);
  CHECK(calls == 1);
}

TEST_CASE_FIXTURE(messenger_fixture, "receiver may remove its own entity") {
  rpc->register_receiver(SAY, [](const entity_id &entity, world &world, const client_id &,
                                 const std::string &) { world.remove_entity(entity); });

  client_msg::ModMessage message{id, SAY.id(), encode(std::string("bye"))};
  CHECK(route_mod_message(game, Id::generate(), message) == RouteResult::Delivered);
  CHECK_FALSE(game.contains(id));
}

TEST_CASE_FIXTURE(messenger_fixture, "failing receiver is reported and the entity stays") {
  rpc->register_receiver(SAY, [](const entity_id &, world &, const client_id &,
                                 const std::string &) { throw std::runtime_error("boom"); });

  client_msg::ModMessage message{id, SAY.id(), encode(std::string("x"))};
  CHECK(route_mod_message(game, Id::generate(), message) == RouteResult::HandlerFailed);
  CHECK(game.contains(id));
  CHECK(rpc->has_receiver(SAY.id()));
}

TEST_CASE("warnings raised before the entity joins a world are logged on start") {
  std::ostringstream out;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("messenger", sink);
  world game(logger);

  auto pending = std::make_unique<entity>();
  auto *rpc = pending->emplace_module<messenger>(PANEL);
  auto noop = [](const entity_id &, world &, const client_id &, const std::string &) {};
  CHECK(rpc->register_receiver(SAY, noop));
  CHECK_FALSE(rpc->register_receiver(SAY, noop));
  CHECK(out.str().empty());

  REQUIRE(game.add_entity(std::move(pending)) != nullptr);
  CHECK(out.str().find("already registered") != std::string::npos);
}

TEST_CASE("transport attached after start is picked up") {
  fake_server_transport transport;
  world game(make_null_logger("messenger"));
  entity_id id = game.new_entity();
  auto *rpc = game.mut_entity(id)->emplace_module<messenger>(PANEL);

  client_id client = Id::generate();
  transport.register_client(client);
  CHECK_FALSE(rpc->add_client(client));

  game.set_transport(&transport);
  CHECK(rpc->add_client(client));
  CHECK(transport.count_of<server_msg::AddClientHandle>() == 1);
}

} // TEST_SUITE
