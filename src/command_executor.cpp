#include "command_executor.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <variant>

#include "spec_files.hpp"

namespace fs = std::filesystem;

namespace {

CommandResult make_result(const std::string& command_id,
                          const char* status,
                          std::optional<std::string> message = std::nullopt,
                          std::optional<std::string> hash = std::nullopt) {
  CommandResult result;
  result.command_id = command_id;
  result.status = status;
  result.message = std::move(message);
  result.current_content_hash = std::move(hash);
  return result;
}

} // namespace

CommandExecutor::CommandExecutor(std::shared_ptr<BridgeIdentity> identity,
                                 std::vector<ProjectConfig> projects,
                                 fs::path audit_path,
                                 EventSink emit,
                                 std::shared_ptr<Logger> logger,
                                 Clock clock)
  : identity_(std::move(identity)),
    audit_path_(std::move(audit_path)),
    emit_(std::move(emit)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("executor")),
    clock_(clock ? std::move(clock) : Clock([]{ return std::chrono::system_clock::now(); })) {
  for(auto& project : projects) {
    auto id = project.id;
    projects_.emplace(std::move(id), std::move(project));
  }
}

CommandResult CommandExecutor::execute(const PendingCommand& command) {
  std::lock_guard<std::mutex> lock(mutex_);
  logger_->info("Executing {} ({})", command.command.type_name(), command.id);
  try {
    return std::visit([&](const auto& body) -> CommandResult {
      using T = std::decay_t<decltype(body)>;
      if constexpr(std::is_same_v<T, ApplyMetadataCommand>) {
        return apply_metadata(command.id, body);
      } else if constexpr(std::is_same_v<T, RenameMachineCommand>) {
        return rename_machine(command.id, body);
      } else if constexpr(std::is_same_v<T, RevokeMachineCommand>) {
        return revoke_machine(command.id);
      } else {
        return execution_request(command.id, body);
      }
    }, command.command.body);
  } catch(const SyncError& e) {
    logger_->warn("{} ({}) failed: {}", command.command.type_name(), command.id, e.what());
    audit(std::string(command.command.type_name()) + " error: " + e.what());
    return make_result(command.id, kResultError, std::string(e.what()));
  } catch(const std::system_error& e) {
    logger_->warn("{} ({}) failed: {}", command.command.type_name(), command.id, e.what());
    audit(std::string(command.command.type_name()) + " error: " + e.what());
    return make_result(command.id, kResultError, std::string(e.what()));
  }
}

CommandResult CommandExecutor::apply_metadata(const std::string& command_id, const ApplyMetadataCommand& command) {
  auto project = projects_.find(command.project_id);
  if(project == projects_.end()) {
    throw NotFoundError("Project not found: " + command.project_id);
  }
  auto doc = load_spec(project->second.specs_dir, command.spec_name);
  if(!doc) {
    throw NotFoundError("Spec not found: " + command.spec_name);
  }

  auto current_hash = doc->content_hash();
  if(command.expected_content_hash && *command.expected_content_hash != current_hash) {
    logger_->warn("Conflict applying metadata to {}: expected {}, found {}",
                  command.spec_name, *command.expected_content_hash, current_hash);
    audit("apply_metadata conflict: " + command.spec_name);
    return make_result(command_id, kResultConflict, std::string("content hash mismatch"), current_hash);
  }

  MetadataUpdate update;
  update.status = command.status;
  update.priority = command.priority;
  update.tags = command.tags;
  if(command.add_depends_on || command.remove_depends_on) {
    auto depends_on = doc->list("depends_on");
    if(command.add_depends_on) {
      for(const auto& dep : *command.add_depends_on) {
        if(std::find(depends_on.begin(), depends_on.end(), dep) == depends_on.end()) {
          depends_on.push_back(dep);
        }
      }
    }
    if(command.remove_depends_on) {
      const auto& removals = *command.remove_depends_on;
      depends_on.erase(std::remove_if(depends_on.begin(), depends_on.end(), [&](const std::string& dep) {
        return std::find(removals.begin(), removals.end(), dep) != removals.end();
      }), depends_on.end());
    }
    update.depends_on = std::move(depends_on);
  }
  update.parent = command.parent;

  auto updated = apply_metadata_update(*doc, update, clock_());
  auto record = updated.to_record();
  auto new_hash = record.content_hash;
  audit("apply_metadata ok: " + command.spec_name);
  logger_->info("Updated metadata of {}", command.spec_name);

  if(emit_) {
    emit_(QueuedEvent{project->second.id, project->second.name, SyncEvent{SpecChangedEvent{std::move(record)}}});
  }
  return make_result(command_id, kResultOk, std::nullopt, new_hash);
}

CommandResult CommandExecutor::rename_machine(const std::string& command_id, const RenameMachineCommand& command) {
  identity_->set_label(command.label);
  audit("rename_machine: " + command.label);
  logger_->info("Machine renamed to '{}'", command.label);
  return make_result(command_id, kResultOk);
}

CommandResult CommandExecutor::revoke_machine(const std::string& command_id) {
  identity_->set_access_token(std::nullopt);
  audit("revoke_machine");
  logger_->warn("Machine revoked by the server; access token cleared");
  return make_result(command_id, kResultOk);
}

CommandResult CommandExecutor::execution_request(const std::string& command_id, const ExecutionRequestCommand& command) {
  audit("execution_request: " + command.request_id + " payload=" + dump_json(command.payload));
  logger_->info("Execution request {} acknowledged", command.request_id);
  return make_result(command_id, kResultOk);
}

void CommandExecutor::audit(const std::string& entry) {
  if(audit_path_.empty()) return;
  std::error_code ec;
  if(audit_path_.has_parent_path()) {
    fs::create_directories(audit_path_.parent_path(), ec);
  }
  std::ofstream out(audit_path_, std::ios::app);
  if(!out) {
    logger_->error("Unable to append to {}", audit_path_.string());
    return;
  }
  out << format_timestamp(clock_()) << ' ' << entry << '\n';
}
