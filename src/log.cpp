#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {
std::mutex g_sink_mutex;
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kLeveledPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void create_loggers_locked() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kLeveledPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kLeveledPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("specsync.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("specsync.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("specsync.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("specsync.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

spdlog::logger* sink_for(const char* base_channel) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();
  if(std::strcmp(base_channel, "print") == 0) return g_print_logger.get();
  if(std::strcmp(base_channel, "print_err") == 0) return g_print_err_logger.get();
  if(std::strcmp(base_channel, "error") == 0) return g_error_logger.get();
  return g_info_logger.get();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() : table_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)), table_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerTable> table)
  : name_(std::move(name)), table_(std::move(table)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

std::shared_ptr<Logger> Logger::child(const std::string& component) {
  std::string name = name_.empty() ? component : name_ + "/" + component;
  return std::shared_ptr<Logger>(new Logger(std::move(name), table_));
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(table_->mutex);
  const auto id = table_->next_id++;
  table_->listeners.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(table_->mutex);
  table_->listeners.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(table_->mutex);
  table_->listeners.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(table_->mutex);
    listeners_snapshot.reserve(table_->listeners.size());
    for(const auto& entry : table_->listeners) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              std::string("log listener threw: ") + e.what());
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, name_, level, message);
}

void init(bool verbose, const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  create_loggers_locked();

  if(!log_file.empty()) {
    std::error_code ec;
    if(log_file.has_parent_path()) {
      std::filesystem::create_directories(log_file.parent_path(), ec);
    }
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    g_info_logger->sinks().push_back(file_sink);
    g_error_logger->sinks().push_back(file_sink);
  }

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(base_channel);
  if(!sink) return;
  if(!channel_name.empty()) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
