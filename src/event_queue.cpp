#include "event_queue.hpp"

#include <algorithm>
#include <cstddef>
#include <system_error>

#include "spec_files.hpp"

namespace fs = std::filesystem;

EventQueue::EventQueue(fs::path file, std::shared_ptr<Logger> logger)
  : file_(std::move(file)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("queue")) {}

void EventQueue::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
  std::error_code ec;
  if(file_.empty() || !fs::exists(file_, ec)) return;
  try {
    events_ = json::parse(read_file(file_)).get<std::vector<QueuedEvent>>();
  } catch(const json::exception& e) {
    logger_->warn("Discarding unreadable queue {}: {}", file_.string(), e.what());
    events_.clear();
  } catch(const SyncError& e) {
    logger_->warn("Discarding unreadable queue {}: {}", file_.string(), e.what());
    events_.clear();
  }
  if(!events_.empty()) {
    logger_->info("Loaded {} queued events", events_.size());
  }
}

void EventQueue::push(QueuedEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(std::move(event));
  save_locked();
}

std::vector<QueuedEvent> EventQueue::front(std::size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  count = std::min(count, events_.size());
  return std::vector<QueuedEvent>(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(count));
}

void EventQueue::pop_front(std::size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  count = std::min(count, events_.size());
  if(count == 0) return;
  events_.erase(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(count));
  save_locked();
}

std::size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void EventQueue::save_locked() {
  if(file_.empty()) return;
  std::error_code ec;
  if(file_.has_parent_path()) {
    fs::create_directories(file_.parent_path(), ec);
  }
  try {
    write_file_atomic(file_, dump_json(json(events_)));
  } catch(const SyncError& e) {
    // the in-memory queue is still authoritative for this run
    logger_->error("Unable to persist queue: {}", e.what());
  }
}
