#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "machine_registry.hpp"

class DeviceAuthService;
class HttpServer;
class SettingsManager;
class SyncApi;

// Owns the cloud side: registry, device authorization, HTTP API and the
// io_context thread pool that serves them.
class SyncServer {
public:
  struct Options {
    Clock clock;  // defaults to the system clock
  };

  SyncServer(std::shared_ptr<SettingsManager> settings, Options options = {});
  ~SyncServer();

  void start();
  void run();
  void start_background();
  void stop();
  // Makes run() return; safe from any thread. Call stop() afterwards.
  void request_stop() { io_.stop(); }

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<MachineRegistry> registry() const { return registry_; }
  std::shared_ptr<DeviceAuthService> device_auth() const { return device_auth_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

  std::uint16_t listen_port() const { return listen_port_; }

  static std::filesystem::path default_state_dir();

private:
  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::vector<std::thread> io_threads_;
  std::shared_ptr<MachineRegistry> registry_;
  std::shared_ptr<DeviceAuthService> device_auth_;
  std::shared_ptr<SyncApi> api_;
  std::unique_ptr<HttpServer> http_;
  bool started_ = false;
  std::uint16_t listen_port_ = 0;
};
