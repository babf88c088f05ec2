#pragma once

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

// Queue between the network receiver threads (producers) and the game
// loop (single consumer). The lock is only held to append or to swap the
// queued vector out.
template <typename T> class PacketInbox {
public:
  void push(T item) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_items.push_back(std::move(item));
  }

  // Everything received since the previous drain, in arrival order
  std::vector<T> drain() {
    std::vector<T> drained;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      drained.swap(m_items);
    }
    return drained;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
  }

private:
  mutable std::mutex m_mutex;
  std::vector<T> m_items;
};
