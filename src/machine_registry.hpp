#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "protocol.hpp"
#include "utils.hpp"

struct ProjectRecord {
  std::string id;
  std::string name;
  std::optional<std::string> path;
  std::map<std::string, SpecRecord> specs;
  std::optional<SystemTime> last_updated;
};

struct MachineRecord {
  std::string id;
  std::string label;
  bool revoked = false;
  std::optional<SystemTime> last_seen;
  std::map<std::string, ProjectRecord> projects;
  std::vector<PendingCommand> pending_commands;
};

struct AccessToken {
  std::string token;
  SystemTime issued_at;
  std::optional<SystemTime> expires_at;
};

struct AuditLogEntry {
  std::string id;
  std::string machine_id;
  std::optional<std::string> project_id;
  std::optional<std::string> spec_name;
  std::string action;
  std::string outcome;
  std::optional<std::string> message;
  SystemTime created_at;
};

struct MachineSummary {
  std::string id;
  std::string label;
  std::string status;  // "online" | "offline"
  std::optional<SystemTime> last_seen;
  std::size_t project_count = 0;
};

void to_json(json& j, const ProjectRecord& project);
void from_json(const json& j, ProjectRecord& project);
void to_json(json& j, const MachineRecord& machine);
void from_json(const json& j, MachineRecord& machine);
void to_json(json& j, const AccessToken& token);
void from_json(const json& j, AccessToken& token);
void to_json(json& j, const AuditLogEntry& entry);
void from_json(const json& j, AuditLogEntry& entry);
void to_json(json& j, const MachineSummary& summary);

// The live end of a machine's command channel. deliver() must not block; the
// registry calls it after releasing its lock.
class CommandSink {
public:
  virtual ~CommandSink() = default;
  virtual void deliver(const PendingCommand& command) = 0;
  virtual void close() = 0;
};

class MachineRegistry {
public:
  struct Options {
    std::filesystem::path state_path;  // empty = memory only
    std::chrono::seconds online_window{30};
    Clock clock;
  };

  explicit MachineRegistry(Options options, std::shared_ptr<Logger> logger = nullptr);

  // Reads the persisted state. A missing file is an empty registry; an
  // unreadable one throws.
  void load();

  MachineRecord ensure_machine(const std::string& machine_id,
                               const std::optional<std::string>& label);

  // Applies the batch in order. Unknown machine -> NotFoundError, revoked ->
  // RevokedError; either way nothing changes.
  void ingest_events(const SyncEventsRequest& request);

  PendingCommand enqueue_command(const std::string& machine_id, SyncCommand command);

  // Returns false (and changes nothing) for an unknown command id.
  bool acknowledge(const std::string& machine_id, const CommandResult& result);

  void register_channel(const std::string& machine_id, std::shared_ptr<CommandSink> sink);
  void unregister_channel(const std::string& machine_id, const CommandSink* sink);
  bool has_channel(const std::string& machine_id) const;

  // Channel handshake: ensure the machine, refresh last_seen, register `sink`
  // (when given) and return the queue, all under one lock.
  std::vector<PendingCommand> hello(const std::string& machine_id,
                                    const std::string& label,
                                    std::shared_ptr<CommandSink> sink = nullptr);
  void touch(const std::string& machine_id);

  MachineSummary rename_machine(const std::string& machine_id, const std::string& label);
  void revoke_machine(const std::string& machine_id);
  PendingCommand request_execution(const std::string& machine_id, json payload);

  std::vector<MachineSummary> list_machines() const;
  MachineRecord machine(const std::string& machine_id) const;
  std::vector<PendingCommand> pending_commands(const std::string& machine_id) const;
  std::vector<AuditLogEntry> audit_log() const;

  void store_token(const AccessToken& token);
  bool validate_token(const std::string& token) const;
  void drop_token(const std::string& token);

  SystemTime now() const { return options_.clock(); }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  MachineRecord& require_machine_locked(const std::string& machine_id);
  MachineRecord& ensure_machine_locked(const std::string& machine_id,
                                       const std::optional<std::string>& label);
  // Runs `mutate`, then writes the state file. If either throws, the machine
  // and the audit log are put back as they were.
  void commit_locked(const std::string& machine_id, const std::function<void()>& mutate);
  std::shared_ptr<CommandSink> install_channel_locked(const std::string& machine_id,
                                                      std::shared_ptr<CommandSink> sink);
  MachineSummary summarize_locked(const MachineRecord& machine) const;
  PendingCommand append_command_locked(MachineRecord& machine, SyncCommand command);
  void append_audit_locked(const std::string& machine_id,
                           const SyncCommand* command,
                           std::string action,
                           std::string outcome,
                           std::optional<std::string> message);
  void push_to_channel(const std::string& machine_id, const PendingCommand& command);
  void save_locked();

  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, MachineRecord> machines_;
  std::vector<AuditLogEntry> audit_log_;
  std::unordered_map<std::string, AccessToken> tokens_;
  std::unordered_map<std::string, std::shared_ptr<CommandSink>> channels_;
};
