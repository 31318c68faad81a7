#include "spec_watcher.hpp"

#include <system_error>

#include "spec_files.hpp"

namespace fs = std::filesystem;

SpecWatcher::SpecWatcher(ProjectConfig project,
                         BlockingChannel<QueuedEvent>& output,
                         std::chrono::milliseconds interval,
                         std::shared_ptr<Logger> logger)
  : project_(std::move(project)),
    output_(output),
    interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("watcher")) {}

SpecWatcher::~SpecWatcher() {
  stop();
}

void SpecWatcher::start() {
  if(running_.exchange(true)) return;
  thread_ = std::thread([this]{ loop(); });
}

void SpecWatcher::stop() {
  if(!running_.exchange(false)) return;
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
  }
  wait_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void SpecWatcher::loop() {
  logger_->info("Watching {} ({})", project_.specs_dir.string(), project_.name);
  while(running_) {
    scan();
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, interval_, [this]{ return !running_; });
  }
}

std::map<std::string, SpecWatcher::FileStamp> SpecWatcher::stamp_directory() const {
  std::map<std::string, FileStamp> stamps;
  std::error_code ec;
  for(fs::directory_iterator it(project_.specs_dir, ec), end; !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().string();
    if(!is_spec_dir_name(name)) continue;
    auto file = it->path() / kSpecFileName;
    std::error_code file_ec;
    FileStamp stamp;
    stamp.mtime = fs::last_write_time(file, file_ec);
    if(file_ec) continue;
    stamp.size = fs::file_size(file, file_ec);
    if(file_ec) continue;
    stamps.emplace(name, stamp);
  }
  if(ec) {
    logger_->warn("Unable to list {}: {}", project_.specs_dir.string(), ec.message());
  }
  return stamps;
}

void SpecWatcher::emit(SyncEvent event) {
  const char* type = event.type_name();
  if(!output_.push(QueuedEvent{project_.id, project_.name, std::move(event)})) {
    logger_->debug("Event channel closed, dropping {} event", type);
  }
}

void SpecWatcher::scan() {
  auto current = stamp_directory();

  if(!initial_scan_done_) {
    std::vector<SpecRecord> specs;
    std::map<std::string, FileStamp> loaded;
    for(const auto& [name, stamp] : current) {
      try {
        if(auto doc = load_spec(project_.specs_dir, name)) {
          specs.push_back(doc->to_record());
          loaded.emplace(name, stamp);
        }
      } catch(const SyncError& e) {
        logger_->warn("Skipping {}: {}", name, e.what());
      }
    }
    known_ = std::move(loaded);
    initial_scan_done_ = true;
    logger_->debug("Snapshot of {}: {} specs", project_.name, specs.size());
    emit(SyncEvent{SnapshotEvent{std::move(specs)}});
    return;
  }

  for(const auto& [name, stamp] : current) {
    auto known = known_.find(name);
    if(known != known_.end() && known->second == stamp) continue;
    try {
      auto doc = load_spec(project_.specs_dir, name);
      if(!doc) continue;
      known_[name] = stamp;
      logger_->debug("Spec changed: {}", name);
      emit(SyncEvent{SpecChangedEvent{doc->to_record()}});
    } catch(const SyncError& e) {
      logger_->warn("Unable to read {}: {}", name, e.what());
    }
  }

  for(auto it = known_.begin(); it != known_.end();) {
    if(current.count(it->first)) {
      ++it;
      continue;
    }
    logger_->debug("Spec deleted: {}", it->first);
    emit(SyncEvent{SpecDeletedEvent{it->first}});
    it = known_.erase(it);
  }
}
