#include "log.hpp"
#include "world.hpp"
#include <doctest/doctest.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Appends "<tag>:<event>" to a shared journal
class recorder : public i_module {
public:
  recorder(std::vector<std::string> &journal, std::string tag)
      : m_journal(journal), m_tag(std::move(tag)) {}

  void start(const entity_id &, world &) override { m_journal.push_back(m_tag + ":start"); }
  void tick(const entity_id &, world &) override { m_journal.push_back(m_tag + ":tick"); }

protected:
  std::vector<std::string> &m_journal;
  std::string m_tag;
};

class other_recorder : public recorder {
public:
  using recorder::recorder;
};

class health : public i_module {
public:
  int points = 100;
};

// Removes an entity from inside its tick
class remover : public i_module {
public:
  explicit remover(entity_id target) : m_target(target) {}
  void tick(const entity_id &, world &world) override {
    removed = world.remove_entity(m_target);
    still_found = world.mut_entity(m_target) != nullptr;
  }

  bool removed = false;
  bool still_found = true;

private:
  entity_id m_target;
};

class self_remover : public i_module {
public:
  self_remover(bool &destroyed, bool &alive_after_remove)
      : m_destroyed(destroyed), m_alive_after_remove(alive_after_remove) {}
  ~self_remover() override { m_destroyed = true; }

  void tick(const entity_id &id, world &world) override {
    world.mut_entity(id)->remove_module<self_remover>();
    m_alive_after_remove = !m_destroyed;
  }

private:
  bool &m_destroyed;
  bool &m_alive_after_remove;
};

} // namespace

TEST_SUITE("world") {

TEST_CASE("modules start when the entity joins the world") {
  world game(make_null_logger("world"));
  std::vector<std::string> journal;

  auto created = std::make_unique<entity>();
  created->emplace_module<recorder>(journal, "a");
  created->emplace_module<other_recorder>(journal, "b");
  CHECK(journal.empty());

  entity *added = game.add_entity(std::move(created));
  REQUIRE(added != nullptr);
  CHECK(journal == std::vector<std::string>{"a:start", "b:start"});
  CHECK(added->in_world());
}

TEST_CASE("module added to a live entity starts immediately") {
  world game(make_null_logger("world"));
  std::vector<std::string> journal;
  entity_id id = game.new_entity();

  game.mut_entity(id)->emplace_module<recorder>(journal, "late");
  CHECK(journal == std::vector<std::string>{"late:start"});
}

TEST_CASE("second module of the same type is rejected") {
  world game(make_null_logger("world"));
  entity_id id = game.new_entity();
  entity *e = game.mut_entity(id);

  auto *first = e->emplace_module<health>();
  REQUIRE(first != nullptr);
  first->points = 5;

  CHECK(e->emplace_module<health>() == nullptr);
  CHECK(e->module_count() == 1);
  CHECK(e->get_module<health>()->points == 5);
}

TEST_CASE("typed lookups") {
  world game(make_null_logger("world"));
  entity_id id = game.new_entity();
  game.mut_entity(id)->emplace_module<health>();

  CHECK(game.mut_module_of<health>(id) != nullptr);
  CHECK(game.get_module_of<recorder>(id) == nullptr);
  CHECK(game.mut_module_of<health>(Id::generate()) == nullptr);
  CHECK(game.mut_entity(Id::generate()) == nullptr);

  CHECK(game.mut_entity(id)->remove_module<health>());
  CHECK_FALSE(game.mut_entity(id)->has_module<health>());
  CHECK_FALSE(game.mut_entity(id)->remove_module<health>());
}

TEST_CASE("tick order is entity insertion then module registration") {
  world game(make_null_logger("world"));
  std::vector<std::string> journal;

  entity_id first = game.new_entity();
  entity_id second = game.new_entity();
  game.mut_entity(second)->emplace_module<recorder>(journal, "2a");
  game.mut_entity(first)->emplace_module<recorder>(journal, "1a");
  game.mut_entity(first)->emplace_module<other_recorder>(journal, "1b");
  journal.clear();

  game.tick();
  CHECK(journal == std::vector<std::string>{"1a:tick", "1b:tick", "2a:tick"});
  CHECK(game.tick_count() == 1);
}

TEST_CASE("names") {
  world game(make_null_logger("world"));
  entity_id chat = game.new_entity("chat");
  entity_id other = game.new_entity();

  REQUIRE(game.find_by_name("chat").has_value());
  CHECK(*game.find_by_name("chat") == chat);
  CHECK(game.get_entity(chat)->name() == "chat");
  CHECK_FALSE(game.tag_entity(other, "chat"));
  CHECK(game.tag_entity(chat, "lobby"));
  CHECK_FALSE(game.find_by_name("chat").has_value());

  game.remove_entity(chat);
  CHECK_FALSE(game.find_by_name("lobby").has_value());
}

TEST_CASE("find_with lists entities holding a module type") {
  world game(make_null_logger("world"));
  entity_id a = game.new_entity();
  game.new_entity();
  entity_id c = game.new_entity();
  game.mut_entity(a)->emplace_module<health>();
  game.mut_entity(c)->emplace_module<health>();

  CHECK(game.find_with<health>() == std::vector<entity_id>{a, c});
  CHECK(game.size() == 3);
}

TEST_CASE("removal during tick is deferred but invisible") {
  world game(make_null_logger("world"));
  std::vector<std::string> journal;

  entity_id killer = game.new_entity();
  entity_id victim = game.new_entity();
  game.mut_entity(victim)->emplace_module<recorder>(journal, "victim");
  auto *r = game.mut_entity(killer)->emplace_module<remover>(victim);
  journal.clear();

  game.tick();
  CHECK(r->removed);
  CHECK_FALSE(r->still_found);
  // The victim comes later in the order and must not tick once removed
  CHECK(journal.empty());
  CHECK(game.size() == 1);
  CHECK_FALSE(game.remove_entity(victim));
}

TEST_CASE("module removing itself survives until its callback returns") {
  world game(make_null_logger("world"));
  bool destroyed = false;
  bool alive_after_remove = false;
  entity_id id = game.new_entity();
  game.mut_entity(id)->emplace_module<self_remover>(destroyed, alive_after_remove);

  game.tick();
  CHECK(alive_after_remove);
  CHECK(destroyed);
  CHECK_FALSE(game.mut_entity(id)->has_module<self_remover>());
}

TEST_CASE("duplicate entity id is refused") {
  world game(make_null_logger("world"));
  entity_id id = Id::generate();
  CHECK(game.add_entity(std::make_unique<entity>(id)) != nullptr);
  CHECK(game.add_entity(std::make_unique<entity>(id)) == nullptr);
  CHECK(game.size() == 1);
}

TEST_CASE("tasks wait the requested number of ticks") {
  world game(make_null_logger("world"));
  std::vector<std::uint64_t> ran_at;
  game.queue_task(
      [&](world &w) -> std::optional<std::uint64_t> {
        ran_at.push_back(w.tick_count());
        if (ran_at.size() < 3)
          return 1;
        return std::nullopt;
      },
      2);
  CHECK(game.task_count() == 1);

  for (int i = 0; i < 10; ++i) {
    game.tick();
  }
  CHECK(ran_at == std::vector<std::uint64_t>{2, 4, 6});
  CHECK(game.task_count() == 0);
}

TEST_CASE("tasks run after the modules and queue follow-ups for the next tick") {
  world game(make_null_logger("world"));
  std::vector<std::string> journal;
  entity_id id = game.new_entity();
  game.mut_entity(id)->emplace_module<recorder>(journal, "a");
  journal.clear();

  game.queue_task([&](world &w) -> std::optional<std::uint64_t> {
    journal.push_back("task");
    w.queue_task([&](world &) -> std::optional<std::uint64_t> {
      journal.push_back("follow-up");
      return std::nullopt;
    });
    return std::nullopt;
  });

  game.tick();
  CHECK(journal == std::vector<std::string>{"a:tick", "task"});
  game.tick();
  CHECK(journal == std::vector<std::string>{"a:tick", "task", "a:tick", "follow-up"});
  CHECK(game.task_count() == 0);
}

TEST_CASE("failing task is dropped") {
  world game(make_null_logger("world"));
  int runs = 0;
  game.queue_task([&](world &) -> std::optional<std::uint64_t> {
    ++runs;
    throw std::runtime_error("task broke");
  });
  game.queue_task(world::task_fn{});
  CHECK(game.task_count() == 1);

  game.tick();
  game.tick();
  CHECK(runs == 1);
  CHECK(game.task_count() == 0);
  CHECK(game.tick_count() == 2);
}

} // TEST_SUITE
