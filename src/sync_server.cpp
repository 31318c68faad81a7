#include "sync_server.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "device_auth.hpp"
#include "http_server.hpp"
#include "settings_manager.hpp"
#include "sync_api.hpp"

SyncServer::SyncServer(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings)
                       : std::make_shared<SettingsManager>(SERVER_SETTINGS_SPECIFICATION)),
    logger_(std::make_shared<Logger>("specsync-server")) {}

SyncServer::~SyncServer() {
  stop();
}

std::filesystem::path SyncServer::default_state_dir() {
  const char* home = std::getenv("HOME");
  std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::current_path();
  return base / ".specsync";
}

void SyncServer::start() {
  if(started_) return;
  started_ = true;

  auto state_path_value = settings_->get<std::string>("state_path");
  std::filesystem::path state_path = state_path_value.empty()
    ? default_state_dir() / "sync_state.json"
    : std::filesystem::path(state_path_value);

  MachineRegistry::Options registry_options;
  registry_options.state_path = state_path;
  registry_options.online_window = std::chrono::seconds(settings_->get<int>("online_window"));
  registry_options.clock = options_.clock;
  registry_ = std::make_shared<MachineRegistry>(registry_options, logger_->child("registry"));
  registry_->load();

  DeviceAuthService::Options auth_options;
  auth_options.verification_url = settings_->get<std::string>("verification_url");
  auth_options.device_code_ttl = std::chrono::seconds(settings_->get<int>("device_code_ttl"));
  auth_options.poll_interval = std::chrono::seconds(settings_->get<int>("device_poll_interval"));
  auth_options.token_ttl = std::chrono::seconds(settings_->get<int>("token_ttl"));
  device_auth_ = std::make_shared<DeviceAuthService>(registry_, auth_options, logger_->child("device-auth"));

  SyncApi::Options api_options;
  if(const char* env_key = std::getenv("SPECSYNC_API_KEY"); env_key && *env_key) {
    api_options.api_key = env_key;
  } else {
    api_options.api_key = settings_->get<std::string>("api_key");
  }
  if(api_options.api_key.empty()) {
    logger_->warn("No API key configured; only device-flow tokens will be accepted");
  }
  api_ = std::make_shared<SyncApi>(registry_, device_auth_, api_options, logger_->child("sync-api"));

  auto listen_ip = settings_->get<std::string>("listen_ip");
  int listen_port_value = settings_->get<int>("listen_port");
  if(listen_port_value < 0 || listen_port_value > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port_value);
    throw std::runtime_error("Invalid listen_port");
  }
  http_ = std::make_unique<HttpServer>(io_, api_, registry_, logger_->child("http"));
  http_->listen(listen_ip, static_cast<std::uint16_t>(listen_port_value));
  listen_port_ = http_->port();
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
}

void SyncServer::run() {
  if(!started_) start();
  int threads = std::max(1, settings_->get<int>("threads"));
  for(int i = 1; i < threads; ++i) {
    io_threads_.emplace_back([this]{ io_.run(); });
  }
  io_.run();
}

void SyncServer::start_background() {
  if(!started_) start();
  if(!io_threads_.empty()) return;
  int threads = std::max(1, settings_->get<int>("threads"));
  for(int i = 0; i < threads; ++i) {
    io_threads_.emplace_back([this]{ io_.run(); });
  }
}

void SyncServer::stop() {
  if(!started_) return;
  started_ = false;

  if(http_) {
    http_->stop();
  }
  work_.reset();
  io_.stop();
  for(auto& thread : io_threads_) {
    if(thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
      thread.join();
    }
  }
  io_threads_.clear();
  io_.restart();
  http_.reset();
}

LogListenerHandle SyncServer::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void SyncServer::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) {
    logger_->remove_listener(handle);
  }
}
