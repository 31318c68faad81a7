#include "machine_registry.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <utility>

#include "sync_error.hpp"

namespace {

json time_or_null(const std::optional<SystemTime>& tp) {
  return tp ? json(format_timestamp(*tp)) : json(nullptr);
}

std::optional<SystemTime> read_time(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  if(!it->is_string()) throw ValidationError(std::string("field '") + key + "' must be a timestamp");
  auto parsed = parse_timestamp(it->get<std::string>());
  if(!parsed) throw ValidationError(std::string("field '") + key + "' is not an RFC 3339 timestamp");
  return parsed;
}

SystemTime require_time(const json& j, const char* key) {
  auto parsed = read_time(j, key);
  if(!parsed) throw ValidationError(std::string("missing field '") + key + "'");
  return *parsed;
}

std::optional<std::string> read_string(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  return it->get<std::string>();
}

const ApplyMetadataCommand* as_apply_metadata(const SyncCommand& command) {
  return std::get_if<ApplyMetadataCommand>(&command.body);
}

} // namespace

void to_json(json& j, const ProjectRecord& project) {
  j = json::object();
  j["id"] = project.id;
  j["name"] = project.name;
  if(project.path) j["path"] = *project.path;
  json specs = json::object();
  for(const auto& [name, spec] : project.specs) {
    specs[name] = spec;
  }
  j["specs"] = std::move(specs);
  j["lastUpdated"] = time_or_null(project.last_updated);
}

void from_json(const json& j, ProjectRecord& project) {
  project.id = j.at("id").get<std::string>();
  project.name = j.value("name", project.id);
  project.path = read_string(j, "path");
  project.specs.clear();
  if(auto it = j.find("specs"); it != j.end() && it->is_object()) {
    for(const auto& item : it->items()) {
      project.specs[item.key()] = item.value().get<SpecRecord>();
    }
  }
  project.last_updated = read_time(j, "lastUpdated");
}

void to_json(json& j, const MachineRecord& machine) {
  j = json::object();
  j["id"] = machine.id;
  j["label"] = machine.label;
  j["revoked"] = machine.revoked;
  j["lastSeen"] = time_or_null(machine.last_seen);
  json projects = json::object();
  for(const auto& [id, project] : machine.projects) {
    projects[id] = project;
  }
  j["projects"] = std::move(projects);
  j["pendingCommands"] = machine.pending_commands;
}

void from_json(const json& j, MachineRecord& machine) {
  machine.id = j.at("id").get<std::string>();
  machine.label = j.value("label", std::string());
  machine.revoked = j.value("revoked", false);
  machine.last_seen = read_time(j, "lastSeen");
  machine.projects.clear();
  if(auto it = j.find("projects"); it != j.end() && it->is_object()) {
    for(const auto& item : it->items()) {
      machine.projects[item.key()] = item.value().get<ProjectRecord>();
    }
  }
  machine.pending_commands.clear();
  if(auto it = j.find("pendingCommands"); it != j.end() && it->is_array()) {
    machine.pending_commands = it->get<std::vector<PendingCommand>>();
  }
}

void to_json(json& j, const AccessToken& token) {
  j = json{{"token", token.token},
           {"issuedAt", format_timestamp(token.issued_at)},
           {"expiresAt", time_or_null(token.expires_at)}};
}

void from_json(const json& j, AccessToken& token) {
  token.token = j.at("token").get<std::string>();
  token.issued_at = require_time(j, "issuedAt");
  token.expires_at = read_time(j, "expiresAt");
}

void to_json(json& j, const AuditLogEntry& entry) {
  j = json::object();
  j["id"] = entry.id;
  j["machineId"] = entry.machine_id;
  j["projectId"] = entry.project_id ? json(*entry.project_id) : json(nullptr);
  j["specName"] = entry.spec_name ? json(*entry.spec_name) : json(nullptr);
  j["action"] = entry.action;
  j["outcome"] = entry.outcome;
  j["message"] = entry.message ? json(*entry.message) : json(nullptr);
  j["createdAt"] = format_timestamp(entry.created_at);
}

void from_json(const json& j, AuditLogEntry& entry) {
  entry.id = j.at("id").get<std::string>();
  entry.machine_id = j.at("machineId").get<std::string>();
  entry.project_id = read_string(j, "projectId");
  entry.spec_name = read_string(j, "specName");
  entry.action = j.at("action").get<std::string>();
  entry.outcome = j.value("outcome", std::string());
  entry.message = read_string(j, "message");
  entry.created_at = require_time(j, "createdAt");
}

void to_json(json& j, const MachineSummary& summary) {
  j = json{{"id", summary.id},
           {"label", summary.label},
           {"status", summary.status},
           {"lastSeen", time_or_null(summary.last_seen)},
           {"projectCount", summary.project_count}};
}

MachineRegistry::MachineRegistry(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("registry")) {
  if(!options_.clock) {
    options_.clock = []{ return std::chrono::system_clock::now(); };
  }
}

void MachineRegistry::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(options_.state_path.empty()) return;
  std::error_code ec;
  if(!std::filesystem::exists(options_.state_path, ec)) {
    logger_->info("No registry state at {}, starting empty", options_.state_path.string());
    return;
  }
  std::ifstream in(options_.state_path);
  if(!in) {
    throw SyncError(ErrorKind::Internal, "unable to read " + options_.state_path.string());
  }
  json doc;
  try {
    in >> doc;
    machines_.clear();
    if(auto it = doc.find("machines"); it != doc.end() && it->is_object()) {
      for(const auto& item : it->items()) {
        machines_[item.key()] = item.value().get<MachineRecord>();
      }
    }
    audit_log_.clear();
    if(auto it = doc.find("auditLog"); it != doc.end() && it->is_array()) {
      audit_log_ = it->get<std::vector<AuditLogEntry>>();
    }
    tokens_.clear();
    if(auto it = doc.find("tokens"); it != doc.end() && it->is_object()) {
      for(const auto& item : it->items()) {
        tokens_[item.key()] = item.value().get<AccessToken>();
      }
    }
  } catch(const json::exception& e) {
    throw SyncError(ErrorKind::Internal,
                    "corrupt registry state " + options_.state_path.string() + ": " + e.what());
  } catch(const ValidationError& e) {
    throw SyncError(ErrorKind::Internal,
                    "corrupt registry state " + options_.state_path.string() + ": " + e.what());
  }
  logger_->info("Loaded {} machine(s), {} audit entries, {} token(s) from {}",
                machines_.size(), audit_log_.size(), tokens_.size(),
                options_.state_path.string());
}

void MachineRegistry::save_locked() {
  if(options_.state_path.empty()) return;

  json doc = json::object();
  json machines = json::object();
  for(const auto& [id, machine] : machines_) {
    machines[id] = machine;
  }
  doc["machines"] = std::move(machines);
  doc["auditLog"] = audit_log_;
  json tokens = json::object();
  for(const auto& [key, token] : tokens_) {
    tokens[key] = token;
  }
  doc["tokens"] = std::move(tokens);

  const auto& path = options_.state_path;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      logger_->error("Unable to write registry state to {}", tmp.string());
      throw SyncError(ErrorKind::Internal, "unable to persist registry state");
    }
    out << dump_json(doc, 2);
    out.flush();
    if(!out) {
      logger_->error("Short write persisting registry state to {}", tmp.string());
      throw SyncError(ErrorKind::Internal, "unable to persist registry state");
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if(ec) {
    logger_->error("Unable to replace {}: {}", path.string(), ec.message());
    throw SyncError(ErrorKind::Internal, "unable to persist registry state");
  }
}

MachineRecord& MachineRegistry::require_machine_locked(const std::string& machine_id) {
  auto it = machines_.find(machine_id);
  if(it == machines_.end()) {
    throw NotFoundError("Machine not found: " + machine_id);
  }
  return it->second;
}

MachineSummary MachineRegistry::summarize_locked(const MachineRecord& machine) const {
  MachineSummary summary;
  summary.id = machine.id;
  summary.label = machine.label;
  summary.last_seen = machine.last_seen;
  summary.project_count = machine.projects.size();
  bool online = channels_.count(machine.id) > 0;
  if(!online && machine.last_seen) {
    online = (options_.clock() - *machine.last_seen) <= options_.online_window;
  }
  summary.status = online ? "online" : "offline";
  return summary;
}

void MachineRegistry::commit_locked(const std::string& machine_id, const std::function<void()>& mutate) {
  std::optional<MachineRecord> before;
  if(auto it = machines_.find(machine_id); it != machines_.end()) {
    before = it->second;
  }
  const auto audit_size = audit_log_.size();
  try {
    mutate();
    save_locked();
  } catch(const SyncError&) {
    if(before) {
      machines_[machine_id] = std::move(*before);
    } else {
      machines_.erase(machine_id);
    }
    audit_log_.resize(audit_size);
    throw;
  }
}

MachineRecord& MachineRegistry::ensure_machine_locked(const std::string& machine_id,
                                                      const std::optional<std::string>& label) {
  if(machine_id.empty()) {
    throw ValidationError("machineId must not be empty");
  }
  auto it = machines_.find(machine_id);
  if(it == machines_.end()) {
    MachineRecord record;
    record.id = machine_id;
    record.label = (label && !label->empty()) ? *label : std::string("Unknown");
    record.last_seen = options_.clock();
    it = machines_.emplace(machine_id, std::move(record)).first;
    logger_->info("Registered machine {} ({})", machine_id, it->second.label);
    return it->second;
  }

  auto& machine = it->second;
  if(machine.revoked || !label || label->empty() || *label == machine.label) {
    return machine;
  }
  // An operator rename is still in flight; the bridge reports its old label
  // until it processes the RenameMachine command.
  bool rename_pending = std::any_of(machine.pending_commands.begin(), machine.pending_commands.end(),
    [](const PendingCommand& pc){ return std::holds_alternative<RenameMachineCommand>(pc.command.body); });
  if(!rename_pending) {
    logger_->info("Machine {} relabelled '{}' -> '{}'", machine_id, machine.label, *label);
    machine.label = *label;
  }
  return machine;
}

MachineRecord MachineRegistry::ensure_machine(const std::string& machine_id,
                                              const std::optional<std::string>& label) {
  std::lock_guard<std::mutex> lock(mutex_);
  MachineRecord out;
  commit_locked(machine_id, [&]{ out = ensure_machine_locked(machine_id, label); });
  return out;
}

void MachineRegistry::ingest_events(const SyncEventsRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& machine = require_machine_locked(request.machine_id);
  if(machine.revoked) {
    logger_->warn("Rejected {} event(s) from revoked machine {}", request.events.size(), machine.id);
    throw RevokedError("Machine revoked");
  }

  // Work on a copy so a failure part-way leaves the stored project untouched.
  const auto now = options_.clock();
  ProjectRecord project;
  if(auto existing = machine.projects.find(request.project_id); existing != machine.projects.end()) {
    project = existing->second;
  } else {
    project.id = request.project_id;
    project.name = request.project_name.value_or(request.project_id);
    project.last_updated = now;
  }
  if(request.project_name) {
    project.name = *request.project_name;
  }

  for(const auto& event : request.events) {
    std::visit([&](const auto& e) {
      using T = std::decay_t<decltype(e)>;
      if constexpr(std::is_same_v<T, SnapshotEvent>) {
        project.specs.clear();
        for(const auto& spec : e.specs) {
          project.specs[spec.spec_name] = spec;
        }
        project.last_updated = now;
      } else if constexpr(std::is_same_v<T, SpecChangedEvent>) {
        project.specs[e.spec.spec_name] = e.spec;
        project.last_updated = now;
      } else if constexpr(std::is_same_v<T, SpecDeletedEvent>) {
        project.specs.erase(e.spec_name);
        project.last_updated = now;
      }
    }, event.body);
  }

  commit_locked(machine.id, [&]{
    machine.projects[request.project_id] = std::move(project);
    machine.last_seen = now;
  });
  logger_->debug("Ingested {} event(s) for machine {} project {}",
                 request.events.size(), request.machine_id, request.project_id);
}

PendingCommand MachineRegistry::append_command_locked(MachineRecord& machine, SyncCommand command) {
  PendingCommand pending;
  pending.id = uuid_v4();
  pending.command = std::move(command);
  pending.created_at = options_.clock();
  machine.pending_commands.push_back(pending);
  append_audit_locked(machine.id, &pending.command, "command_issued",
                      pending.command.type_name(), std::nullopt);
  logger_->info("Queued {} command {} for machine {} ({} pending)",
                pending.command.type_name(), pending.id, machine.id,
                machine.pending_commands.size());
  return pending;
}

void MachineRegistry::append_audit_locked(const std::string& machine_id,
                                          const SyncCommand* command,
                                          std::string action,
                                          std::string outcome,
                                          std::optional<std::string> message) {
  AuditLogEntry entry;
  entry.id = uuid_v4();
  entry.machine_id = machine_id;
  if(command) {
    if(const auto* apply = as_apply_metadata(*command)) {
      entry.project_id = apply->project_id;
      entry.spec_name = apply->spec_name;
    }
  }
  entry.action = std::move(action);
  entry.outcome = std::move(outcome);
  entry.message = std::move(message);
  entry.created_at = options_.clock();
  audit_log_.push_back(std::move(entry));
}

void MachineRegistry::push_to_channel(const std::string& machine_id, const PendingCommand& command) {
  std::shared_ptr<CommandSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(machine_id);
    if(it == channels_.end()) return;
    sink = it->second;
  }
  logger_->debug("Pushing command {} to connected machine {}", command.id, machine_id);
  sink->deliver(command);
}

PendingCommand MachineRegistry::enqueue_command(const std::string& machine_id, SyncCommand command) {
  PendingCommand pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& machine = require_machine_locked(machine_id);
    commit_locked(machine_id, [&]{ pending = append_command_locked(machine, std::move(command)); });
  }
  push_to_channel(machine_id, pending);
  return pending;
}

bool MachineRegistry::acknowledge(const std::string& machine_id, const CommandResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto machine_it = machines_.find(machine_id);
  if(machine_it == machines_.end()) return false;
  auto& queue = machine_it->second.pending_commands;
  auto it = std::find_if(queue.begin(), queue.end(),
                         [&](const PendingCommand& pc){ return pc.id == result.command_id; });
  if(it == queue.end()) {
    logger_->debug("Ignoring result for unknown command {} from {}", result.command_id, machine_id);
    return false;
  }

  auto message = result.message;
  if(result.current_content_hash) {
    message = message.value_or("") + (message ? " " : "") + "(current hash " + *result.current_content_hash + ")";
  }
  PendingCommand done = *it;
  commit_locked(machine_id, [&]{
    queue.erase(it);
    append_audit_locked(machine_id, &done.command, "command_result", result.status, std::move(message));
  });
  logger_->info("Command {} ({}) on machine {} finished: {}",
                done.id, done.command.type_name(), machine_id, result.status);
  return true;
}

std::shared_ptr<CommandSink> MachineRegistry::install_channel_locked(const std::string& machine_id,
                                                                     std::shared_ptr<CommandSink> sink) {
  auto& slot = channels_[machine_id];
  std::shared_ptr<CommandSink> replaced;
  if(slot && slot != sink) {
    replaced = std::move(slot);
  }
  slot = std::move(sink);
  return replaced;
}

void MachineRegistry::register_channel(const std::string& machine_id, std::shared_ptr<CommandSink> sink) {
  std::shared_ptr<CommandSink> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    replaced = install_channel_locked(machine_id, std::move(sink));
  }
  if(replaced) {
    logger_->info("Machine {} reconnected, closing previous channel", machine_id);
    replaced->close();
  }
}

void MachineRegistry::unregister_channel(const std::string& machine_id, const CommandSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = channels_.find(machine_id);
  if(it != channels_.end() && it->second.get() == sink) {
    channels_.erase(it);
    logger_->info("Machine {} disconnected", machine_id);
  }
}

bool MachineRegistry::has_channel(const std::string& machine_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return channels_.count(machine_id) > 0;
}

std::vector<PendingCommand> MachineRegistry::hello(const std::string& machine_id,
                                                   const std::string& label,
                                                   std::shared_ptr<CommandSink> sink) {
  std::vector<PendingCommand> pending;
  std::shared_ptr<CommandSink> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    commit_locked(machine_id, [&]{
      auto& machine = ensure_machine_locked(machine_id, label);
      if(machine.revoked) {
        throw RevokedError("Machine revoked");
      }
      machine.last_seen = options_.clock();
    });
    // Same critical section as the copy: a command queued from here on is
    // pushed to this sink instead of being missed by both paths.
    if(sink) {
      replaced = install_channel_locked(machine_id, std::move(sink));
    }
    pending = machines_.at(machine_id).pending_commands;
  }
  if(replaced) {
    logger_->info("Machine {} reconnected, closing previous channel", machine_id);
    replaced->close();
  }
  return pending;
}

void MachineRegistry::touch(const std::string& machine_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = machines_.find(machine_id);
  if(it == machines_.end()) return;
  commit_locked(machine_id, [&]{ it->second.last_seen = options_.clock(); });
}

MachineSummary MachineRegistry::rename_machine(const std::string& machine_id, const std::string& label) {
  if(trim_copy(label).empty()) {
    throw ValidationError("label must not be empty");
  }
  PendingCommand pending;
  MachineSummary summary;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& machine = require_machine_locked(machine_id);
    commit_locked(machine_id, [&]{
      machine.label = label;
      pending = append_command_locked(machine, SyncCommand{RenameMachineCommand{label}});
    });
    summary = summarize_locked(machines_.at(machine_id));
  }
  push_to_channel(machine_id, pending);
  return summary;
}

void MachineRegistry::revoke_machine(const std::string& machine_id) {
  PendingCommand pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& machine = require_machine_locked(machine_id);
    commit_locked(machine_id, [&]{
      machine.revoked = true;
      pending = append_command_locked(machine, SyncCommand{RevokeMachineCommand{}});
    });
  }
  logger_->warn("Machine {} revoked", machine_id);
  push_to_channel(machine_id, pending);
}

PendingCommand MachineRegistry::request_execution(const std::string& machine_id, json payload) {
  return enqueue_command(machine_id, SyncCommand{ExecutionRequestCommand{uuid_v4(), std::move(payload)}});
}

std::vector<MachineSummary> MachineRegistry::list_machines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MachineSummary> out;
  out.reserve(machines_.size());
  for(const auto& [id, machine] : machines_) {
    out.push_back(summarize_locked(machine));
  }
  return out;
}

MachineRecord MachineRegistry::machine(const std::string& machine_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = machines_.find(machine_id);
  if(it == machines_.end()) {
    throw NotFoundError("Machine not found: " + machine_id);
  }
  return it->second;
}

std::vector<PendingCommand> MachineRegistry::pending_commands(const std::string& machine_id) const {
  return machine(machine_id).pending_commands;
}

std::vector<AuditLogEntry> MachineRegistry::audit_log() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return audit_log_;
}

void MachineRegistry::store_token(const AccessToken& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<AccessToken> before;
  if(auto it = tokens_.find(token.token); it != tokens_.end()) {
    before = it->second;
  }
  tokens_[token.token] = token;
  try {
    save_locked();
  } catch(const SyncError&) {
    if(before) {
      tokens_[token.token] = *before;
    } else {
      tokens_.erase(token.token);
    }
    throw;
  }
}

bool MachineRegistry::validate_token(const std::string& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(token);
  if(it == tokens_.end()) return false;
  if(it->second.expires_at) {
    return *it->second.expires_at > options_.clock();
  }
  return true;
}

void MachineRegistry::drop_token(const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(token);
  if(it == tokens_.end()) return;
  auto before = it->second;
  tokens_.erase(it);
  try {
    save_locked();
  } catch(const SyncError&) {
    tokens_[token] = std::move(before);
    throw;
  }
}
