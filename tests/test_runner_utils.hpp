#pragma once

#include "bridge_agent.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_server.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace specsync::test {

class LogCapture;

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Throws so the runner reports the failed expectation next to the test name.
inline void expect(bool condition, const std::string& what) {
  if(!condition) {
    throw std::runtime_error("expectation failed: " + what);
  }
}

inline void configure(const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value) {
  std::string error;
  if(!settings->set_from_json(key, value, error)) {
    throw std::runtime_error("Failed to set setting " + key + ": " + error);
  }
}

// Fresh directory under the system temp dir, removed again on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& name) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("specsync_test_" + name + "_" + std::to_string(counter.fetch_add(1)));
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path& file, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(file.parent_path(), ec);
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw std::runtime_error("unable to write " + file.string());
  }
  out << content;
}

inline std::string read_text(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// <root>/specs/<name>/README.md with a frontmatter block.
inline std::filesystem::path write_spec(const std::filesystem::path& project_root,
                                        const std::string& name,
                                        const std::string& status,
                                        const std::string& extra_frontmatter = std::string(),
                                        const std::string& body = std::string()) {
  auto file = project_root / "specs" / name / "README.md";
  std::string content = "---\nstatus: " + status + "\ncreated: '2024-01-15'\n" + extra_frontmatter +
                        "---\n\n# " + name + "\n\n" +
                        (body.empty() ? std::string("Some text.\n") : body);
  write_text(file, content);
  return file;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(make_listener(label), nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void attach(SyncServer& server, const std::string& label = std::string()) {
    attach(server.logger(), label);
  }

  void attach(BridgeAgent& agent, const std::string& label = std::string()) {
    attach(agent.logger(), label);
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  Logger::Listener make_listener(const std::string& label) {
    return [this, label](void*,
                         const std::string& channel,
                         spdlog::level::level_enum,
                         const std::string& message) {
      std::lock_guard<std::mutex> lock(mutex_);
      if(!label.empty()) {
        lines_.emplace_back(label + ": " + message);
      } else {
        lines_.emplace_back(channel + ": " + message);
      }
      cv_.notify_all();
      return false;
    };
  }

  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Suite registration, one function per test file.
void register_protocol_tests(std::vector<TestCase>& tests);
void register_registry_tests(std::vector<TestCase>& tests);
void register_spec_file_tests(std::vector<TestCase>& tests);
void register_bridge_tests(std::vector<TestCase>& tests);
void register_wire_tests(std::vector<TestCase>& tests);
void register_end_to_end_tests(std::vector<TestCase>& tests);

} // namespace specsync::test
