#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "blocking_channel.hpp"
#include "bridge_config.hpp"
#include "command_channel.hpp"
#include "log.hpp"
#include "protocol.hpp"

class CommandExecutor;
class EventQueue;
class EventSender;
class EventTransport;
class HttpClient;
class SettingsManager;
class SpecWatcher;

// The local bridge: identity, credentials, one watcher per project, the event
// sender and the command channel.
class BridgeAgent {
public:
  struct Options {
    Clock clock;
    // Replaces the HTTP events transport (tests).
    std::shared_ptr<EventTransport> transport;
    std::chrono::milliseconds event_heartbeat_interval{std::chrono::seconds(30)};
    CommandChannel::Options channel;
    std::chrono::milliseconds http_timeout{std::chrono::seconds(15)};
  };

  BridgeAgent(std::shared_ptr<SettingsManager> settings, Options options = {});
  ~BridgeAgent();

  // Resolves configuration and credentials and starts every task. Throws
  // ConfigError on unrecoverable misconfiguration.
  void start();
  // Blocks until request_stop(), then stops.
  void run();
  void start_background();
  void stop();
  void request_stop();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<BridgeIdentity> identity() const { return identity_; }
  std::shared_ptr<EventQueue> queue() const { return queue_; }
  std::shared_ptr<CommandChannel> channel() const { return channel_; }
  std::shared_ptr<CommandExecutor> executor() const { return executor_; }
  const std::vector<ProjectConfig>& projects() const { return projects_; }
  const std::filesystem::path& config_dir() const { return config_dir_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  static std::filesystem::path default_config_dir();

private:
  void resolve_configuration();
  bool ensure_credentials();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::filesystem::path config_dir_;
  std::vector<ProjectConfig> projects_;

  std::shared_ptr<BridgeIdentity> identity_;
  std::shared_ptr<HttpClient> http_;
  std::shared_ptr<asio::ssl::context> tls_;
  ServerUrl url_;
  std::shared_ptr<EventQueue> queue_;
  std::shared_ptr<EventTransport> transport_;
  std::shared_ptr<CommandExecutor> executor_;
  BlockingChannel<QueuedEvent> events_;
  std::unique_ptr<EventSender> sender_;
  std::vector<std::unique_ptr<SpecWatcher>> watchers_;
  std::shared_ptr<CommandChannel> channel_;

  bool started_ = false;
  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
};
