#include "test_runner_utils.hpp"

#include "protocol.hpp"
#include "sync_error.hpp"
#include "utils.hpp"

namespace specsync::test {
namespace {

SpecRecord make_spec(const std::string& name, const std::string& status) {
  SpecRecord spec;
  spec.spec_name = name;
  spec.status = status;
  spec.content_md = "---\nstatus: " + status + "\n---\n# " + name + "\n";
  spec.content_hash = sha256_hex(spec.content_md);
  spec.tags = {"api"};
  return spec;
}

template<typename T>
bool throws_validation(const std::string& text) {
  try {
    decode_message<T>(text);
  } catch(const ValidationError&) {
    return true;
  }
  return false;
}

bool test_event_batch_shape(TestContext&) {
  SyncEventsRequest request;
  request.machine_id = "m-1";
  request.machine_label = "laptop";
  request.project_id = "p-1";
  request.project_name = "demo";
  request.events.push_back(SyncEvent{SnapshotEvent{{make_spec("001-foo", "planned")}}});
  request.events.push_back(SyncEvent{SpecDeletedEvent{"002-bar"}});
  request.events.push_back(SyncEvent{HeartbeatEvent{std::string(kProtocolVersion), 3}});

  json j = request;
  expect(j.at("machineId") == "m-1", "machineId key");
  expect(j.at("events").size() == 3, "three events");
  expect(j.at("events")[0].at("type") == "snapshot", "snapshot tag");
  expect(j.at("events")[0].at("specs")[0].at("specName") == "001-foo", "camelCase spec name");
  expect(j.at("events")[1].at("type") == "spec_deleted", "delete tag");
  expect(j.at("events")[2].at("queueDepth") == 3, "queue depth");

  auto decoded = decode_message<SyncEventsRequest>(j.dump());
  expect(decoded.events.size() == 3, "decoded event count");
  const auto* snapshot = std::get_if<SnapshotEvent>(&decoded.events[0].body);
  expect(snapshot != nullptr && snapshot->specs.size() == 1, "snapshot decoded");
  expect(snapshot->specs.front() == make_spec("001-foo", "planned"), "spec survives the wire");
  return true;
}

bool test_content_hash_checked(TestContext&) {
  auto spec = make_spec("001-foo", "planned");
  json j = spec;
  j["contentHash"] = sha256_hex("something else");
  json event = {{"type", "spec_changed"}, {"spec", j}};
  return throws_validation<SyncEvent>(event.dump());
}

bool test_unknown_tags_rejected(TestContext&) {
  bool event = throws_validation<SyncEvent>(R"({"type":"spec_renamed"})");
  bool command = throws_validation<SyncCommand>(R"({"type":"format_disk"})");
  bool message = throws_validation<BridgeMessage>(R"({"type":"goodbye"})");
  bool garbage = throws_validation<BridgeMessage>("{not json");
  bool missing = throws_validation<SyncEventsRequest>(R"({"machineId":"m","events":[]})");
  return event && command && message && garbage && missing;
}

bool test_parent_tri_state(TestContext&) {
  auto absent = decode_message<SyncCommand>(R"({"type":"apply_metadata","projectId":"p","specName":"001-a"})");
  auto cleared = decode_message<SyncCommand>(R"({"type":"apply_metadata","projectId":"p","specName":"001-a","parent":null})");
  auto set = decode_message<SyncCommand>(R"({"type":"apply_metadata","projectId":"p","specName":"001-a","parent":"000-root"})");

  const auto& a = std::get<ApplyMetadataCommand>(absent.body);
  const auto& c = std::get<ApplyMetadataCommand>(cleared.body);
  const auto& s = std::get<ApplyMetadataCommand>(set.body);
  expect(!a.parent.has_value(), "absent parent");
  expect(c.parent.has_value() && !c.parent->has_value(), "null parent clears");
  expect(s.parent && *s.parent && **s.parent == "000-root", "parent value");

  json back = cleared;
  expect(back.contains("parent") && back.at("parent").is_null(), "null parent re-encoded");
  json none = absent;
  expect(!none.contains("parent"), "absent parent omitted");
  return true;
}

bool test_pending_command_shape(TestContext&) {
  PendingCommand pending;
  pending.id = "c-1";
  pending.command = SyncCommand{ExecutionRequestCommand{"r-1", json{{"cmd", "build"}}}};
  pending.created_at = *parse_timestamp("2024-05-01T12:00:00.000Z");

  json j = pending;
  expect(j.at("createdAt") == "2024-05-01T12:00:00.000Z", "timestamp format");
  expect(j.at("command").at("type") == "execution_request", "command tag");
  expect(j.at("command").at("requestId") == "r-1", "request id");

  auto back = decode_message<PendingCommand>(j.dump());
  expect(back.created_at == pending.created_at, "timestamp round trip");
  expect(std::get<ExecutionRequestCommand>(back.command.body).payload.at("cmd") == "build", "payload");
  return true;
}

bool test_bridge_messages(TestContext&) {
  auto hello = decode_message<BridgeMessage>(R"({"type":"hello","machineId":"m-1","machineLabel":"box","version":"1.0.0"})");
  auto* h = std::get_if<HelloMessage>(&hello.body);
  expect(h && h->machine_id == "m-1" && h->machine_label == "box", "hello decoded");

  auto result = decode_message<BridgeMessage>(
    R"({"type":"command_result","commandId":"c-9","status":"conflict","message":"content hash mismatch","currentContentHash":"abc"})");
  auto* r = std::get_if<CommandResult>(&result.body);
  expect(r && r->status == kResultConflict, "result status");
  expect(r->current_content_hash && *r->current_content_hash == "abc", "current hash");

  auto beat = decode_message<BridgeMessage>(R"({"type":"heartbeat","queueDepth":2})");
  expect(std::get<ChannelHeartbeat>(beat.body).queue_depth == 2, "heartbeat depth");
  return throws_validation<BridgeMessage>(R"({"type":"heartbeat","queueDepth":-1})");
}

bool test_timestamps_and_ids(TestContext&) {
  auto parsed = parse_timestamp("2024-01-15T08:30:00Z");
  expect(parsed.has_value(), "parse without millis");
  expect(format_timestamp(*parsed) == "2024-01-15T08:30:00.000Z", "canonical format");
  expect(!parse_timestamp("yesterday"), "garbage rejected");

  auto id = uuid_v4();
  expect(is_uuid(id), "v4 is a uuid");
  auto a = uuid_v5(id, "/home/me/project");
  auto b = uuid_v5(id, "/home/me/project");
  auto c = uuid_v5(id, "/home/me/other");
  expect(a == b && a != c && is_uuid(a), "v5 is stable per name");
  expect(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256");
  return true;
}

} // namespace

void register_protocol_tests(std::vector<TestCase>& tests) {
  tests.push_back({"protocol_event_batch_shape", test_event_batch_shape});
  tests.push_back({"protocol_content_hash_checked", test_content_hash_checked});
  tests.push_back({"protocol_unknown_tags_rejected", test_unknown_tags_rejected});
  tests.push_back({"protocol_parent_tri_state", test_parent_tri_state});
  tests.push_back({"protocol_pending_command_shape", test_pending_command_shape});
  tests.push_back({"protocol_bridge_messages", test_bridge_messages});
  tests.push_back({"protocol_timestamps_and_ids", test_timestamps_and_ids});
}

} // namespace specsync::test
