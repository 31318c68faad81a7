#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

// The bridge's offline queue (bridge-queue.json). Events that failed to send
// wait here, oldest first, and survive restarts.
class EventQueue {
public:
  explicit EventQueue(std::filesystem::path file, std::shared_ptr<Logger> logger = nullptr);

  // A missing file is an empty queue; a corrupt one is logged and discarded.
  void load();

  void push(QueuedEvent event);

  // Copies of the oldest `count` events; the queue and its file are untouched.
  std::vector<QueuedEvent> front(std::size_t count) const;

  // Drops the oldest `count` events once they have been delivered.
  void pop_front(std::size_t count);

  std::size_t size() const;

private:
  void save_locked();

  std::filesystem::path file_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<QueuedEvent> events_;
};
