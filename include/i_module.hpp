#pragma once

#include "id.hpp"

class world;

/*
 * Behaviour attached to one entity. An entity holds at most one module of
 * each concrete type and owns it exclusively; the world drives the
 * lifecycle callbacks from the game loop thread.
 */
class i_module {
public:
  virtual ~i_module() = default;

  // Called once when the owning entity joins a world, or right away when
  // the module is added to an entity that is already in one
  virtual void start(const entity_id &id, world &world) {}
  // Called once per world tick
  virtual void tick(const entity_id &id, world &world) {}
};
