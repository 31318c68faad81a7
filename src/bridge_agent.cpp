#include "bridge_agent.hpp"

#include <cstdlib>
#include <system_error>

#include "command_executor.hpp"
#include "device_flow.hpp"
#include "event_queue.hpp"
#include "event_sender.hpp"
#include "settings_manager.hpp"
#include "spec_watcher.hpp"
#include "transport.hpp"

namespace fs = std::filesystem;

BridgeAgent::BridgeAgent(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings)
                       : std::make_shared<SettingsManager>(BRIDGE_SETTINGS_SPECIFICATION)),
    logger_(std::make_shared<Logger>("bridge")) {
  if(!options_.clock) {
    options_.clock = []{ return std::chrono::system_clock::now(); };
  }
}

BridgeAgent::~BridgeAgent() {
  stop();
}

fs::path BridgeAgent::default_config_dir() {
  const char* home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) : fs::current_path();
  return base / ".specsync";
}

void BridgeAgent::resolve_configuration() {
  auto dir = settings_->get<std::string>("config_dir");
  config_dir_ = dir.empty() ? default_config_dir() : fs::path(dir);
  std::error_code ec;
  fs::create_directories(config_dir_, ec);
  if(ec) {
    throw ConfigError("Unable to create config directory " + config_dir_.string() + ": " + ec.message());
  }

  auto config = load_bridge_config(config_dir_ / "bridge.json");

  auto project_paths = settings_->get<std::vector<std::string>>("project");
  if(!project_paths.empty()) {
    config.projects.clear();
    for(const auto& path : project_paths) {
      config.projects.push_back(build_project_config(path, config.machine_id));
    }
  }
  auto label = settings_->get<std::string>("label");
  if(!label.empty()) {
    config.machine_label = label;
  }
  auto api_key = settings_->get<std::string>("api_key");
  if(!api_key.empty()) {
    config.api_key = api_key;
  }
  config.server_url = settings_->get<std::string>("server_url");

  url_ = parse_server_url(config.server_url);
  ensure_transport_allowed(url_, settings_->get<bool>("allow_insecure"));

  projects_ = config.projects;
  identity_ = std::make_shared<BridgeIdentity>(config_dir_ / "bridge.json", std::move(config));
  identity_->save();
}

bool BridgeAgent::ensure_credentials() {
  if(auto key = identity_->api_key(); key && !key->empty()) {
    logger_->debug("Using API key authentication");
    return true;
  }
  if(auto token = identity_->access_token(); token && !token->empty()) {
    logger_->debug("Using stored access token");
    return true;
  }
  DeviceFlowClient flow(http_, logger_->child("device-flow"));
  auto token = flow.authorize(identity_->label(), stop_requested_);
  if(!token) return false;
  identity_->set_access_token(*token);
  return true;
}

void BridgeAgent::start() {
  if(started_) return;
  started_ = true;

  resolve_configuration();
  logger_->info("Machine {} ('{}'), server {}", identity_->machine_id(), identity_->label(),
                identity_->server_url());
  if(projects_.empty()) {
    logger_->warn("No projects configured; use --project <path> to sync one");
  }

  tls_ = url_.tls() ? make_tls_context() : nullptr;
  http_ = std::make_shared<HttpClient>(url_, tls_, options_.http_timeout);

  if(!ensure_credentials()) {
    logger_->info("Stopped before authorization completed");
    return;
  }

  queue_ = std::make_shared<EventQueue>(config_dir_ / "bridge-queue.json", logger_->child("queue"));
  queue_->load();

  transport_ = options_.transport ? options_.transport
                                  : std::make_shared<HttpEventTransport>(http_, identity_);

  executor_ = std::make_shared<CommandExecutor>(identity_,
                                                projects_,
                                                config_dir_ / "bridge-audit.log",
                                                [this](QueuedEvent event) {
                                                  if(!events_.push(std::move(event))) {
                                                    logger_->debug("Stopping, follow-up event not sent");
                                                  }
                                                },
                                                logger_->child("executor"),
                                                options_.clock);

  EventSender::Options sender_options;
  sender_options.heartbeat_interval = options_.event_heartbeat_interval;
  sender_ = std::make_unique<EventSender>(transport_, identity_, queue_, events_, projects_,
                                          sender_options, logger_->child("sender"));
  sender_->start();

  auto interval = std::chrono::milliseconds(settings_->get<int>("watch_interval_ms"));
  for(const auto& project : projects_) {
    auto watcher = std::make_unique<SpecWatcher>(project, events_, interval, logger_->child("watcher"));
    watcher->start();
    watchers_.push_back(std::move(watcher));
  }

  auto executor = executor_;
  auto queue = queue_;
  channel_ = CommandChannel::create(url_,
                                    tls_,
                                    identity_,
                                    [executor](const PendingCommand& command){ return executor->execute(command); },
                                    [queue]{ return queue->size(); },
                                    options_.channel,
                                    logger_->child("channel"));
  channel_->start();
}

void BridgeAgent::run() {
  if(!started_) start();
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait(lock, [this]{ return stop_requested_.load(); });
  lock.unlock();
  stop();
}

void BridgeAgent::start_background() {
  if(!started_) start();
}

void BridgeAgent::request_stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

void BridgeAgent::stop() {
  if(!started_) return;
  started_ = false;

  for(auto& watcher : watchers_) {
    watcher->stop();
  }
  watchers_.clear();

  if(channel_) {
    channel_->stop();
  }

  events_.close();
  if(sender_) {
    sender_->stop();
    sender_.reset();
  }
  // keep unsent follow-ups for the next run
  std::size_t carried = 0;
  while(auto event = events_.pop()) {
    if(queue_) {
      queue_->push(std::move(*event));
      ++carried;
    }
  }
  if(carried > 0) {
    logger_->info("Queued {} unsent events for the next run", carried);
  }
  channel_.reset();
}

LogListenerHandle BridgeAgent::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void BridgeAgent::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) {
    logger_->remove_listener(handle);
  }
}
