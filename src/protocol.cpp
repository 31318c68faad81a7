#include "protocol.hpp"

#include <type_traits>

std::string dump_json(const json& value, int indent) {
  return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

namespace {

const json& require_field(const json& j, const char* key) {
  if(!j.is_object()) throw ValidationError("expected JSON object");
  auto it = j.find(key);
  if(it == j.end()) throw ValidationError(std::string("missing field '") + key + "'");
  return *it;
}

std::string require_string(const json& j, const char* key) {
  const auto& v = require_field(j, key);
  if(!v.is_string()) throw ValidationError(std::string("field '") + key + "' must be a string");
  return v.get<std::string>();
}

std::string require_nonempty(const json& j, const char* key) {
  auto value = require_string(j, key);
  if(value.empty()) throw ValidationError(std::string("field '") + key + "' must not be empty");
  return value;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  if(!it->is_string()) throw ValidationError(std::string("field '") + key + "' must be a string");
  return it->get<std::string>();
}

std::vector<std::string> string_list(const json& v, const char* key) {
  if(!v.is_array()) throw ValidationError(std::string("field '") + key + "' must be an array");
  std::vector<std::string> out;
  out.reserve(v.size());
  for(const auto& item : v) {
    if(!item.is_string()) throw ValidationError(std::string("field '") + key + "' must hold strings");
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::optional<std::vector<std::string>> optional_list(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  return string_list(*it, key);
}

std::size_t optional_count(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return 0;
  if(!it->is_number_unsigned() && !(it->is_number_integer() && it->get<long long>() >= 0)) {
    throw ValidationError(std::string("field '") + key + "' must be a non-negative integer");
  }
  return it->get<std::size_t>();
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
  if(value) j[key] = *value;
}

void put_optional(json& j, const char* key, const std::optional<std::vector<std::string>>& value) {
  if(value) j[key] = *value;
}

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

bool operator==(const SpecRecord& a, const SpecRecord& b) {
  return a.spec_name == b.spec_name && a.title == b.title && a.status == b.status &&
         a.priority == b.priority && a.tags == b.tags && a.assignee == b.assignee &&
         a.content_md == b.content_md && a.content_hash == b.content_hash &&
         a.created_at == b.created_at && a.updated_at == b.updated_at &&
         a.completed_at == b.completed_at && a.depends_on == b.depends_on &&
         a.parent == b.parent && a.file_path == b.file_path;
}

void to_json(json& j, const SpecRecord& spec) {
  j = json::object();
  j["specName"] = spec.spec_name;
  j["title"] = spec.title ? json(*spec.title) : json(nullptr);
  j["status"] = spec.status;
  j["priority"] = spec.priority ? json(*spec.priority) : json(nullptr);
  j["tags"] = spec.tags;
  j["assignee"] = spec.assignee ? json(*spec.assignee) : json(nullptr);
  j["contentMd"] = spec.content_md;
  j["contentHash"] = spec.content_hash;
  j["createdAt"] = spec.created_at ? json(*spec.created_at) : json(nullptr);
  j["updatedAt"] = spec.updated_at ? json(*spec.updated_at) : json(nullptr);
  j["completedAt"] = spec.completed_at ? json(*spec.completed_at) : json(nullptr);
  j["dependsOn"] = spec.depends_on;
  put_optional(j, "parent", spec.parent);
  j["filePath"] = spec.file_path ? json(*spec.file_path) : json(nullptr);
}

void from_json(const json& j, SpecRecord& spec) {
  spec.spec_name = require_nonempty(j, "specName");
  spec.title = optional_string(j, "title");
  spec.status = require_string(j, "status");
  spec.priority = optional_string(j, "priority");
  spec.tags = optional_list(j, "tags").value_or(std::vector<std::string>{});
  spec.assignee = optional_string(j, "assignee");
  spec.content_md = require_string(j, "contentMd");
  spec.content_hash = require_string(j, "contentHash");
  spec.created_at = optional_string(j, "createdAt");
  spec.updated_at = optional_string(j, "updatedAt");
  spec.completed_at = optional_string(j, "completedAt");
  spec.depends_on = optional_list(j, "dependsOn").value_or(std::vector<std::string>{});
  spec.parent = optional_string(j, "parent");
  spec.file_path = optional_string(j, "filePath");
  if(spec.content_hash != sha256_hex(spec.content_md)) {
    throw ValidationError("contentHash does not match contentMd for spec '" + spec.spec_name + "'");
  }
}

const char* SyncEvent::type_name() const {
  return std::visit(overloaded{
    [](const SnapshotEvent&) { return "snapshot"; },
    [](const SpecChangedEvent&) { return "spec_changed"; },
    [](const SpecDeletedEvent&) { return "spec_deleted"; },
    [](const HeartbeatEvent&) { return "heartbeat"; }
  }, body);
}

void to_json(json& j, const SyncEvent& event) {
  j = json::object();
  j["type"] = event.type_name();
  std::visit(overloaded{
    [&](const SnapshotEvent& e) { j["specs"] = e.specs; },
    [&](const SpecChangedEvent& e) { j["spec"] = e.spec; },
    [&](const SpecDeletedEvent& e) { j["specName"] = e.spec_name; },
    [&](const HeartbeatEvent& e) {
      put_optional(j, "version", e.version);
      j["queueDepth"] = e.queue_depth;
    }
  }, event.body);
}

void from_json(const json& j, SyncEvent& event) {
  auto type = require_string(j, "type");
  if(type == "snapshot") {
    const auto& specs = require_field(j, "specs");
    if(!specs.is_array()) throw ValidationError("field 'specs' must be an array");
    event.body = SnapshotEvent{specs.get<std::vector<SpecRecord>>()};
  } else if(type == "spec_changed") {
    event.body = SpecChangedEvent{require_field(j, "spec").get<SpecRecord>()};
  } else if(type == "spec_deleted") {
    event.body = SpecDeletedEvent{require_nonempty(j, "specName")};
  } else if(type == "heartbeat") {
    event.body = HeartbeatEvent{optional_string(j, "version"), optional_count(j, "queueDepth")};
  } else {
    throw ValidationError("unknown event type '" + type + "'");
  }
}

void to_json(json& j, const SyncEventsRequest& request) {
  j = json::object();
  j["machineId"] = request.machine_id;
  put_optional(j, "machineLabel", request.machine_label);
  j["projectId"] = request.project_id;
  put_optional(j, "projectName", request.project_name);
  j["events"] = request.events;
}

void from_json(const json& j, SyncEventsRequest& request) {
  request.machine_id = require_nonempty(j, "machineId");
  request.machine_label = optional_string(j, "machineLabel");
  request.project_id = require_nonempty(j, "projectId");
  request.project_name = optional_string(j, "projectName");
  const auto& events = require_field(j, "events");
  if(!events.is_array()) throw ValidationError("field 'events' must be an array");
  request.events = events.get<std::vector<SyncEvent>>();
}

const char* SyncCommand::type_name() const {
  return std::visit(overloaded{
    [](const ApplyMetadataCommand&) { return "apply_metadata"; },
    [](const RenameMachineCommand&) { return "rename_machine"; },
    [](const RevokeMachineCommand&) { return "revoke_machine"; },
    [](const ExecutionRequestCommand&) { return "execution_request"; }
  }, body);
}

void to_json(json& j, const SyncCommand& command) {
  j = json::object();
  j["type"] = command.type_name();
  std::visit(overloaded{
    [&](const ApplyMetadataCommand& c) {
      j["projectId"] = c.project_id;
      j["specName"] = c.spec_name;
      put_optional(j, "status", c.status);
      put_optional(j, "priority", c.priority);
      put_optional(j, "tags", c.tags);
      put_optional(j, "addDependsOn", c.add_depends_on);
      put_optional(j, "removeDependsOn", c.remove_depends_on);
      if(c.parent) {
        j["parent"] = *c.parent ? json(**c.parent) : json(nullptr);
      }
      put_optional(j, "expectedContentHash", c.expected_content_hash);
    },
    [&](const RenameMachineCommand& c) { j["label"] = c.label; },
    [&](const RevokeMachineCommand&) {},
    [&](const ExecutionRequestCommand& c) {
      j["requestId"] = c.request_id;
      j["payload"] = c.payload;
    }
  }, command.body);
}

void from_json(const json& j, SyncCommand& command) {
  auto type = require_string(j, "type");
  if(type == "apply_metadata") {
    ApplyMetadataCommand c;
    c.project_id = require_nonempty(j, "projectId");
    c.spec_name = require_nonempty(j, "specName");
    c.status = optional_string(j, "status");
    c.priority = optional_string(j, "priority");
    c.tags = optional_list(j, "tags");
    c.add_depends_on = optional_list(j, "addDependsOn");
    c.remove_depends_on = optional_list(j, "removeDependsOn");
    if(auto it = j.find("parent"); it != j.end()) {
      if(it->is_null()) {
        c.parent = std::optional<std::string>{};
      } else if(it->is_string()) {
        c.parent = std::optional<std::string>{it->get<std::string>()};
      } else {
        throw ValidationError("field 'parent' must be a string or null");
      }
    }
    c.expected_content_hash = optional_string(j, "expectedContentHash");
    command.body = std::move(c);
  } else if(type == "rename_machine") {
    command.body = RenameMachineCommand{require_nonempty(j, "label")};
  } else if(type == "revoke_machine") {
    command.body = RevokeMachineCommand{};
  } else if(type == "execution_request") {
    auto it = j.find("payload");
    command.body = ExecutionRequestCommand{require_nonempty(j, "requestId"),
                                           it == j.end() ? json(nullptr) : *it};
  } else {
    throw ValidationError("unknown command type '" + type + "'");
  }
}

void to_json(json& j, const PendingCommand& command) {
  j = json::object();
  j["id"] = command.id;
  j["command"] = command.command;
  j["createdAt"] = format_timestamp(command.created_at);
}

void from_json(const json& j, PendingCommand& command) {
  command.id = require_nonempty(j, "id");
  command.command = require_field(j, "command").get<SyncCommand>();
  auto created = parse_timestamp(require_string(j, "createdAt"));
  if(!created) throw ValidationError("field 'createdAt' is not an RFC 3339 timestamp");
  command.created_at = *created;
}

const char* BridgeMessage::type_name() const {
  return std::visit(overloaded{
    [](const HelloMessage&) { return "hello"; },
    [](const ChannelHeartbeat&) { return "heartbeat"; },
    [](const CommandResult&) { return "command_result"; }
  }, body);
}

void to_json(json& j, const BridgeMessage& message) {
  j = json::object();
  j["type"] = message.type_name();
  std::visit(overloaded{
    [&](const HelloMessage& m) {
      j["machineId"] = m.machine_id;
      j["machineLabel"] = m.machine_label;
      put_optional(j, "version", m.version);
    },
    [&](const ChannelHeartbeat& m) { j["queueDepth"] = m.queue_depth; },
    [&](const CommandResult& m) {
      j["commandId"] = m.command_id;
      j["status"] = m.status;
      put_optional(j, "message", m.message);
      put_optional(j, "currentContentHash", m.current_content_hash);
    }
  }, message.body);
}

void from_json(const json& j, BridgeMessage& message) {
  auto type = require_string(j, "type");
  if(type == "hello") {
    message.body = HelloMessage{require_nonempty(j, "machineId"),
                                optional_string(j, "machineLabel").value_or(""),
                                optional_string(j, "version")};
  } else if(type == "heartbeat") {
    message.body = ChannelHeartbeat{optional_count(j, "queueDepth")};
  } else if(type == "command_result") {
    message.body = CommandResult{require_nonempty(j, "commandId"),
                                 require_nonempty(j, "status"),
                                 optional_string(j, "message"),
                                 optional_string(j, "currentContentHash")};
  } else {
    throw ValidationError("unknown bridge message type '" + type + "'");
  }
}

void to_json(json& j, const QueuedEvent& event) {
  j = json::object();
  j["projectId"] = event.project_id;
  j["projectName"] = event.project_name;
  j["event"] = event.event;
}

void from_json(const json& j, QueuedEvent& event) {
  event.project_id = require_nonempty(j, "projectId");
  event.project_name = require_string(j, "projectName");
  event.event = require_field(j, "event").get<SyncEvent>();
}

json make_success_ack() {
  return json{{"success", true}};
}

json make_error_body(const std::string& error, const std::string& message) {
  return json{{"error", error}, {"message", message}};
}
