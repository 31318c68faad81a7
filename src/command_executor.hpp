#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bridge_config.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "protocol.hpp"

// Runs server-pushed commands against the local working copy. Every command
// yields exactly one CommandResult and one line in bridge-audit.log.
class CommandExecutor {
public:
  using EventSink = std::function<void(QueuedEvent)>;

  CommandExecutor(std::shared_ptr<BridgeIdentity> identity,
                  std::vector<ProjectConfig> projects,
                  std::filesystem::path audit_path,
                  EventSink emit,
                  std::shared_ptr<Logger> logger,
                  Clock clock = {});

  CommandResult execute(const PendingCommand& command);

private:
  CommandResult apply_metadata(const std::string& command_id, const ApplyMetadataCommand& command);
  CommandResult rename_machine(const std::string& command_id, const RenameMachineCommand& command);
  CommandResult revoke_machine(const std::string& command_id);
  CommandResult execution_request(const std::string& command_id, const ExecutionRequestCommand& command);

  void audit(const std::string& entry);

  std::shared_ptr<BridgeIdentity> identity_;
  std::map<std::string, ProjectConfig> projects_;
  std::filesystem::path audit_path_;
  EventSink emit_;
  std::shared_ptr<Logger> logger_;
  Clock clock_;
  std::mutex mutex_;  // one command touches the working copy at a time
};
