#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "blocking_channel.hpp"
#include "bridge_config.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Polls one project's specs directory. The first scan emits a Snapshot; later
// scans emit SpecChanged for new or modified README files and SpecDeleted for
// spec directories that disappeared.
class SpecWatcher {
public:
  SpecWatcher(ProjectConfig project,
              BlockingChannel<QueuedEvent>& output,
              std::chrono::milliseconds interval,
              std::shared_ptr<Logger> logger);
  ~SpecWatcher();

  void start();
  void stop();

  // One polling pass; exposed so tests can drive the watcher without a thread.
  void scan();

  const ProjectConfig& project() const { return project_; }

private:
  struct FileStamp {
    std::filesystem::file_time_type mtime;
    std::uintmax_t size = 0;
    bool operator==(const FileStamp& other) const { return mtime == other.mtime && size == other.size; }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
  };

  std::map<std::string, FileStamp> stamp_directory() const;
  void emit(SyncEvent event);
  void loop();

  ProjectConfig project_;
  BlockingChannel<QueuedEvent>& output_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;

  bool initial_scan_done_ = false;
  std::map<std::string, FileStamp> known_;

  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread thread_;
};
