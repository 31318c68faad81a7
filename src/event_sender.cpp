#include "event_sender.hpp"

#include <algorithm>
#include <cstddef>
#include <system_error>

#include "transport.hpp"

HttpEventTransport::HttpEventTransport(std::shared_ptr<HttpClient> client, std::shared_ptr<BridgeIdentity> identity)
  : client_(std::move(client)), identity_(std::move(identity)) {}

void HttpEventTransport::post_events(const SyncEventsRequest& request) {
  auto response = client_->post_json("/api/sync/events", json(request), identity_.get());
  if(response.status >= 200 && response.status < 300) return;
  std::string detail = response.body;
  try {
    auto body = json::parse(response.body);
    detail = body.value("message", body.value("error", response.body));
  } catch(const json::exception&) {
    // non-JSON body, keep it raw
  }
  if(response.status == 401) {
    throw AuthError("events rejected (401): " + detail);
  }
  throw TransportError("events rejected (" + std::to_string(response.status) + "): " + detail);
}

EventSender::EventSender(std::shared_ptr<EventTransport> transport,
                         std::shared_ptr<BridgeIdentity> identity,
                         std::shared_ptr<EventQueue> queue,
                         BlockingChannel<QueuedEvent>& input,
                         std::vector<ProjectConfig> projects,
                         Options options,
                         std::shared_ptr<Logger> logger)
  : transport_(std::move(transport)),
    identity_(std::move(identity)),
    queue_(std::move(queue)),
    input_(input),
    projects_(std::move(projects)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sender")) {}

EventSender::~EventSender() {
  stop();
}

void EventSender::start() {
  if(running_.exchange(true)) return;
  thread_ = std::thread([this]{ loop(); });
}

void EventSender::stop() {
  running_ = false;
  if(thread_.joinable()) thread_.join();
}

void EventSender::loop() {
  auto next_heartbeat = std::chrono::steady_clock::now() + options_.heartbeat_interval;
  while(running_) {
    auto wait = next_heartbeat - std::chrono::steady_clock::now();
    if(wait < std::chrono::steady_clock::duration::zero()) wait = std::chrono::steady_clock::duration::zero();
    auto slice = std::min<std::chrono::steady_clock::duration>(wait, std::chrono::milliseconds(250));
    auto event = input_.pop_for(slice);
    if(event) {
      process(*event);
    } else if(input_.closed()) {
      break;
    }
    if(std::chrono::steady_clock::now() >= next_heartbeat) {
      send_heartbeats();
      next_heartbeat = std::chrono::steady_clock::now() + options_.heartbeat_interval;
    }
  }
}

void EventSender::send(const QueuedEvent& event) {
  SyncEventsRequest request;
  request.machine_id = identity_->machine_id();
  request.machine_label = identity_->label();
  request.project_id = event.project_id;
  request.project_name = event.project_name;
  request.events.push_back(event.event);
  transport_->post_events(request);
}

bool EventSender::process(const QueuedEvent& event) {
  // Older queued events go first; while any are stuck, new ones line up behind them.
  if(queue_->size() > 0) {
    flush_queue();
    if(queue_->size() > 0) {
      queue_->push(event);
      logger_->debug("Server still unreachable, queued {} event ({} pending)",
                     event.event.type_name(), queue_->size());
      return false;
    }
  }
  try {
    send(event);
  } catch(const SyncError& e) {
    queue_->push(event);
    logger_->warn("Failed to send {} event, queued ({} pending): {}",
                  event.event.type_name(), queue_->size(), e.what());
    return false;
  } catch(const std::system_error& e) {
    queue_->push(event);
    logger_->warn("Failed to send {} event, queued ({} pending): {}",
                  event.event.type_name(), queue_->size(), e.what());
    return false;
  }
  logger_->debug("Sent {} event for {}", event.event.type_name(), event.project_name);
  flush_queue();
  return true;
}

std::size_t EventSender::flush_queue() {
  auto pending = queue_->front(queue_->size());
  if(pending.empty()) return 0;

  // Each event leaves the queue file only after the server has taken it.
  std::size_t sent = 0;
  for(; sent < pending.size(); ++sent) {
    try {
      send(pending[sent]);
    } catch(const SyncError& e) {
      logger_->warn("Queue flush stopped after {} of {}: {}", sent, pending.size(), e.what());
      break;
    } catch(const std::system_error& e) {
      logger_->warn("Queue flush stopped after {} of {}: {}", sent, pending.size(), e.what());
      break;
    }
    queue_->pop_front(1);
  }
  if(sent == pending.size()) {
    logger_->info("Flushed {} queued events", sent);
  }
  return sent;
}

void EventSender::send_heartbeats() {
  for(const auto& project : projects_) {
    HeartbeatEvent heartbeat;
    heartbeat.version = kProtocolVersion;
    heartbeat.queue_depth = queue_->size();
    QueuedEvent event{project.id, project.name, SyncEvent{heartbeat}};
    try {
      send(event);
    } catch(const SyncError& e) {
      logger_->debug("Heartbeat for {} failed: {}", project.name, e.what());
    } catch(const std::system_error& e) {
      logger_->debug("Heartbeat for {} failed: {}", project.name, e.what());
    }
  }
}
