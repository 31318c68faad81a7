#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "blocking_channel.hpp"
#include "bridge_config.hpp"
#include "event_queue.hpp"
#include "log.hpp"
#include "protocol.hpp"

class HttpClient;

// Delivers one batch to the server; throws on any failure.
class EventTransport {
public:
  virtual ~EventTransport() = default;
  virtual void post_events(const SyncEventsRequest& request) = 0;
};

// POST /api/sync/events. Non-2xx answers become TransportError (or AuthError
// for 401) so the sender queues the event.
class HttpEventTransport : public EventTransport {
public:
  HttpEventTransport(std::shared_ptr<HttpClient> client, std::shared_ptr<BridgeIdentity> identity);
  void post_events(const SyncEventsRequest& request) override;

private:
  std::shared_ptr<HttpClient> client_;
  std::shared_ptr<BridgeIdentity> identity_;
};

// The single outbound task: drains the event channel in order, falls back to
// the on-disk queue when a send fails, and flushes the queue after every
// success. Also emits the periodic per-project heartbeat.
class EventSender {
public:
  struct Options {
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  };

  EventSender(std::shared_ptr<EventTransport> transport,
              std::shared_ptr<BridgeIdentity> identity,
              std::shared_ptr<EventQueue> queue,
              BlockingChannel<QueuedEvent>& input,
              std::vector<ProjectConfig> projects,
              Options options,
              std::shared_ptr<Logger> logger);
  ~EventSender();

  void start();
  void stop();

  // Flushes any backlog first, then sends or queues. Returns true when the
  // event itself was delivered.
  bool process(const QueuedEvent& event);

  // Sends queued events oldest-first, stopping at the first failure. Returns
  // the number delivered.
  std::size_t flush_queue();

  void send_heartbeats();

  std::size_t queue_depth() const { return queue_->size(); }

private:
  void send(const QueuedEvent& event);
  void loop();

  std::shared_ptr<EventTransport> transport_;
  std::shared_ptr<BridgeIdentity> identity_;
  std::shared_ptr<EventQueue> queue_;
  BlockingChannel<QueuedEvent>& input_;
  std::vector<ProjectConfig> projects_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};
