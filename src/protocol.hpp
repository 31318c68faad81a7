#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sync_error.hpp"
#include "utils.hpp"

using json = nlohmann::json;

// protocol.hpp
//
// Wire types shared by the server and the bridge. Every tagged union carries an
// explicit "type" discriminant (snake_case); all other keys are camelCase.
// Decoding throws ValidationError on any malformed field.

// Serializes for the wire or disk. Invalid UTF-8 in strings becomes U+FFFD
// instead of throwing.
std::string dump_json(const json& value, int indent = -1);

inline constexpr const char* kProtocolVersion = "1.0.0";
inline constexpr const char* kBridgeChannelPath = "/api/sync/bridge/ws";

struct SpecRecord {
  std::string spec_name;
  std::optional<std::string> title;
  std::string status;
  std::optional<std::string> priority;
  std::vector<std::string> tags;
  std::optional<std::string> assignee;
  std::string content_md;
  std::string content_hash;
  std::optional<std::string> created_at;
  std::optional<std::string> updated_at;
  std::optional<std::string> completed_at;
  std::vector<std::string> depends_on;
  std::optional<std::string> parent;
  std::optional<std::string> file_path;
};

bool operator==(const SpecRecord& a, const SpecRecord& b);

// ---- outbound events (bridge -> POST /api/sync/events) -------------------

struct SnapshotEvent { std::vector<SpecRecord> specs; };
struct SpecChangedEvent { SpecRecord spec; };
struct SpecDeletedEvent { std::string spec_name; };
struct HeartbeatEvent {
  std::optional<std::string> version;
  std::size_t queue_depth = 0;
};

struct SyncEvent {
  std::variant<SnapshotEvent, SpecChangedEvent, SpecDeletedEvent, HeartbeatEvent> body;
  const char* type_name() const;
};

struct SyncEventsRequest {
  std::string machine_id;
  std::optional<std::string> machine_label;
  std::string project_id;
  std::optional<std::string> project_name;
  std::vector<SyncEvent> events;
};

// ---- commands (server -> bridge) -----------------------------------------

struct ApplyMetadataCommand {
  std::string project_id;
  std::string spec_name;
  std::optional<std::string> status;
  std::optional<std::string> priority;
  std::optional<std::vector<std::string>> tags;
  std::optional<std::vector<std::string>> add_depends_on;
  std::optional<std::vector<std::string>> remove_depends_on;
  // absent = leave alone, null = clear, value = set
  std::optional<std::optional<std::string>> parent;
  std::optional<std::string> expected_content_hash;
};

struct RenameMachineCommand { std::string label; };
struct RevokeMachineCommand {};
struct ExecutionRequestCommand {
  std::string request_id;
  json payload;
};

struct SyncCommand {
  std::variant<ApplyMetadataCommand, RenameMachineCommand, RevokeMachineCommand, ExecutionRequestCommand> body;
  const char* type_name() const;
};

struct PendingCommand {
  std::string id;
  SyncCommand command;
  SystemTime created_at;
};

// ---- channel frames (bridge -> server) -----------------------------------

struct HelloMessage {
  std::string machine_id;
  std::string machine_label;
  std::optional<std::string> version;
};

struct ChannelHeartbeat { std::size_t queue_depth = 0; };

inline constexpr const char* kResultOk = "ok";
inline constexpr const char* kResultConflict = "conflict";
inline constexpr const char* kResultError = "error";

struct CommandResult {
  std::string command_id;
  std::string status;
  std::optional<std::string> message;
  std::optional<std::string> current_content_hash;
};

struct BridgeMessage {
  std::variant<HelloMessage, ChannelHeartbeat, CommandResult> body;
  const char* type_name() const;
};

// ---- bridge-local queue entry --------------------------------------------

struct QueuedEvent {
  std::string project_id;
  std::string project_name;
  SyncEvent event;
};

void to_json(json& j, const SpecRecord& spec);
void from_json(const json& j, SpecRecord& spec);
void to_json(json& j, const SyncEvent& event);
void from_json(const json& j, SyncEvent& event);
void to_json(json& j, const SyncEventsRequest& request);
void from_json(const json& j, SyncEventsRequest& request);
void to_json(json& j, const SyncCommand& command);
void from_json(const json& j, SyncCommand& command);
void to_json(json& j, const PendingCommand& command);
void from_json(const json& j, PendingCommand& command);
void to_json(json& j, const BridgeMessage& message);
void from_json(const json& j, BridgeMessage& message);
void to_json(json& j, const QueuedEvent& event);
void from_json(const json& j, QueuedEvent& event);

// Parses a text frame / body, mapping any JSON error to ValidationError.
template<typename T>
T decode_message(const std::string& text) {
  try {
    return json::parse(text).get<T>();
  } catch(const json::exception& e) {
    throw ValidationError(std::string("malformed payload: ") + e.what());
  }
}

json make_success_ack();
json make_error_body(const std::string& error, const std::string& message);
