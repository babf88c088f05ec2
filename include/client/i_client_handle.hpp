#pragma once

class client_messenger;
class data_store;

// Client-side counterpart of a server entity's messenger. Created when the
// server sends AddClientHandle, destroyed on RemoveClientHandle.
class i_client_handle {
public:
  virtual ~i_client_handle() = default;

  virtual void start(client_messenger &messenger, data_store &store) {}
  virtual void update(client_messenger &messenger, data_store &store, float dt) {}
  virtual void remove(client_messenger &messenger, data_store &store) {}
};
