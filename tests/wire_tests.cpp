#include "test_runner_utils.hpp"

#include "device_auth.hpp"
#include "http_message.hpp"
#include "machine_registry.hpp"
#include "sync_api.hpp"
#include "sync_error.hpp"
#include "utils.hpp"
#include "websocket.hpp"

namespace specsync::test {
namespace {

struct ApiFixture {
  ApiFixture() {
    registry = std::make_shared<MachineRegistry>(MachineRegistry::Options{}, std::make_shared<Logger>("registry"));
    auth = std::make_shared<DeviceAuthService>(registry, DeviceAuthService::Options{});
    api = std::make_shared<SyncApi>(registry, auth, SyncApi::Options{"test-key"}, std::make_shared<Logger>("sync-api"));
  }

  HttpResponse call(const std::string& method,
                    const std::string& target,
                    const json& body = json(),
                    bool with_key = true) {
    HttpRequest request;
    request.method = method;
    request.target = target;
    if(with_key) request.set_header("x-api-key", "test-key");
    if(!body.is_null()) request.body = body.dump();
    return api->handle(request);
  }

  static json body_of(const HttpResponse& response) {
    return response.body.empty() ? json() : json::parse(response.body);
  }

  std::shared_ptr<MachineRegistry> registry;
  std::shared_ptr<DeviceAuthService> auth;
  std::shared_ptr<SyncApi> api;
};

json events_body(const std::string& machine_id, const std::string& status) {
  SpecRecord spec;
  spec.spec_name = "001-foo";
  spec.status = status;
  spec.content_md = "---\nstatus: " + status + "\n---\n";
  spec.content_hash = sha256_hex(spec.content_md);

  SyncEventsRequest request;
  request.machine_id = machine_id;
  request.machine_label = "laptop";
  request.project_id = "project-1";
  request.project_name = "demo";
  request.events.push_back(SyncEvent{SnapshotEvent{{spec}}});
  return request;
}

bool test_websocket_accept_key(TestContext&) {
  // RFC 6455 section 1.3 sample
  expect(websocket_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=", "accept key");

  HttpRequest request;
  request.method = "GET";
  request.target = "/api/sync/bridge/ws";
  request.set_header("Connection", "keep-alive, Upgrade");
  request.set_header("Upgrade", "WebSocket");
  request.set_header("Sec-WebSocket-Key", "dGhlIHNhbXBsZSBub25jZQ==");
  expect(is_websocket_upgrade(request), "upgrade detected");
  auto response = make_upgrade_response(request);
  expect(response.status == 101, "switching protocols");
  expect(response.header("sec-websocket-accept") == std::optional<std::string>("s3pPLMBiTxaQ9kYGzzhZRbK+xOo="),
         "accept header");

  request.headers.erase("sec-websocket-key");
  return !is_websocket_upgrade(request);
}

bool test_websocket_framing(TestContext&) {
  std::string large(70000, 'x');
  WsFrameDecoder server(true);
  auto a = encode_frame(WsOpcode::Text, R"({"type":"hello"})", true);
  auto b = encode_frame(WsOpcode::Text, large, true);
  auto ping = encode_frame(WsOpcode::Ping, "p", true);
  std::string wire = a + b + ping;

  // byte-at-a-time delivery
  std::vector<WsFrame> frames;
  for(char c : wire) {
    server.append(&c, 1);
    while(auto frame = server.next()) {
      frames.push_back(std::move(*frame));
    }
  }
  expect(frames.size() == 3, "three frames");
  expect(frames[0].payload == R"({"type":"hello"})", "small payload unmasked");
  expect(frames[1].payload == large, "64-bit length payload");
  expect(frames[2].opcode == WsOpcode::Ping, "ping surfaced");
  expect(server.buffered() == 0, "nothing left over");

  // fragmented text message with an interleaved control frame
  std::string first = encode_frame(WsOpcode::Text, "hel", false);
  first[0] = static_cast<char>(first[0] & 0x7F);
  auto pong = encode_frame(WsOpcode::Pong, "", false);
  auto last = encode_frame(WsOpcode::Continuation, "lo", false);
  WsFrameDecoder client(false);
  auto joined = first + pong + last;
  client.append(joined.data(), joined.size());
  auto control = client.next();
  auto message = client.next();
  expect(control && control->opcode == WsOpcode::Pong, "control frame between fragments");
  expect(message && message->opcode == WsOpcode::Text && message->payload == "hello", "reassembled");

  WsFrameDecoder strict(true);
  auto unmasked = encode_frame(WsOpcode::Text, "hi", false);
  strict.append(unmasked.data(), unmasked.size());
  try {
    expect(!strict.next(), "unmasked frame surfaced");
  } catch(const ValidationError&) {
    return true;
  }
  return false;
}

bool test_http_messages(TestContext&) {
  auto request = parse_request_head(
    "POST /api/sync/events?debug=1 HTTP/1.1\r\n"
    "Host: localhost\r\n"
    "X-Api-Key: k\r\n"
    "Content-Length: 12\r\n"
    "\r\n");
  expect(request.method == "POST" && request.path() == "/api/sync/events", "request line");
  expect(request.query() == "debug=1", "query split");
  expect(request.header("x-api-key") == std::optional<std::string>("k"), "lower-cased header");
  expect(content_length(request.headers) == 12, "content length");

  auto response = parse_response_head("HTTP/1.1 401 Unauthorized\r\ncontent-type: application/json\r\n\r\n");
  expect(response.status == 401 && response.reason == "Unauthorized", "status line");

  auto wire = serialize(make_json_response(200, "{}"));
  expect(wire.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "status line serialized");
  expect(wire.find("content-length: 2\r\n") != std::string::npos, "length added");

  HttpHeaders bad{{"content-length", "12abc"}};
  bool malformed = false;
  try {
    content_length(bad);
  } catch(const ValidationError&) {
    malformed = true;
  }
  HttpHeaders huge{{"content-length", std::to_string(kMaxBodyBytes + 1)}};
  bool too_large = false;
  try {
    content_length(huge);
  } catch(const ValidationError&) {
    too_large = true;
  }
  bool bad_target = false;
  try {
    parse_request_head("GET http://elsewhere/ HTTP/1.1\r\n\r\n");
  } catch(const ValidationError&) {
    bad_target = true;
  }
  return malformed && too_large && bad_target;
}

bool test_api_requires_credentials(TestContext&) {
  ApiFixture fx;
  auto anonymous = fx.call("GET", "/api/sync/machines", json(), false);
  expect(anonymous.status == 401, "401 without credentials");
  expect(ApiFixture::body_of(anonymous).at("error") == "unauthorized", "error body");

  HttpRequest wrong;
  wrong.method = "GET";
  wrong.target = "/api/sync/machines";
  wrong.set_header("x-api-key", "nope");
  expect(fx.api->handle(wrong).status == 401, "wrong key rejected");

  AccessToken token{"tok-1", fx.registry->now(), std::nullopt};
  fx.registry->store_token(token);
  HttpRequest bearer;
  bearer.method = "GET";
  bearer.target = "/api/sync/machines";
  bearer.set_header("authorization", "Bearer tok-1");
  expect(fx.api->handle(bearer).status == 200, "bearer accepted");

  auto events = fx.call("POST", "/api/sync/events", events_body("machine-1", "planned"), false);
  expect(events.status == 401, "ingest needs credentials");
  return fx.registry->list_machines().empty();
}

bool test_api_ingest_and_list(TestContext&) {
  ApiFixture fx;
  auto ingest = fx.call("POST", "/api/sync/events", events_body("machine-1", "planned"));
  expect(ingest.status == 200 && ApiFixture::body_of(ingest).at("success") == true, "ingest ok");

  auto list = ApiFixture::body_of(fx.call("GET", "/api/sync/machines"));
  expect(list.at("machines").size() == 1, "one machine");
  const auto& summary = list.at("machines")[0];
  expect(summary.at("id") == "machine-1" && summary.at("label") == "laptop", "summary identity");
  expect(summary.at("status") == "online" && summary.at("projectCount") == 1, "summary state");

  auto detail = ApiFixture::body_of(fx.call("GET", "/api/sync/machines/machine-1"));
  expect(detail.at("projects").at("project-1").at("specs").at("001-foo").at("status") == "planned", "detail");

  auto tampered = events_body("machine-1", "complete");
  tampered["events"][0]["specs"][0]["contentHash"] = sha256_hex("other");
  auto rejected = fx.call("POST", "/api/sync/events", tampered);
  expect(rejected.status == 400, "hash mismatch is a 400");
  auto after = fx.registry->machine("machine-1").projects.at("project-1").specs.at("001-foo");
  expect(after.status == "planned", "rejected batch changed nothing");

  expect(fx.call("GET", "/api/sync/machines/nobody").status == 404, "unknown machine");
  expect(fx.call("GET", "/api/sync/elsewhere").status == 404, "unknown route");
  expect(fx.call("PUT", "/api/sync/events").status == 405, "wrong method");
  return fx.call("POST", "/api/sync/events", json{{"machineId", "m"}}).status == 400;
}

bool test_api_operator_commands(TestContext&) {
  ApiFixture fx;
  expect(fx.call("POST", "/api/sync/events", events_body("machine-1", "planned")).status == 200, "seeded");

  auto rename = fx.call("PATCH", "/api/sync/machines/machine-1", json{{"label", "build box"}});
  expect(rename.status == 200 && ApiFixture::body_of(rename).at("label") == "build box", "rename");
  expect(fx.call("PATCH", "/api/sync/machines/machine-1", json::object()).status == 400, "label required");

  auto exec = fx.call("POST", "/api/sync/machines/machine-1/execution", json{{"payload", {{"run", "tests"}}}});
  expect(exec.status == 200 && ApiFixture::body_of(exec).contains("commandId"), "execution queued");

  auto meta = fx.call("POST", "/api/sync/machines/machine-1/metadata",
                      json{{"projectId", "project-1"}, {"specName", "001-foo"}, {"status", "in-progress"}});
  expect(meta.status == 200, "metadata queued");
  auto bad_meta = fx.call("POST", "/api/sync/machines/machine-1/metadata", json{{"status", "complete"}});
  expect(bad_meta.status == 400, "metadata needs a spec");

  auto pending = fx.registry->pending_commands("machine-1");
  expect(pending.size() == 3, "three commands queued");
  expect(std::string(pending[0].command.type_name()) == "rename_machine", "in order");
  expect(std::string(pending[2].command.type_name()) == "apply_metadata", "metadata last");

  auto revoke = fx.call("DELETE", "/api/sync/machines/machine-1");
  expect(revoke.status == 204 && revoke.body.empty(), "revoke is 204");
  auto ingest = fx.call("POST", "/api/sync/events", events_body("machine-1", "complete"));
  expect(ingest.status == 403, "revoked machine refused");
  expect(fx.call("GET", "/api/sync/machines").status == 200, "still listable");

  auto audit = ApiFixture::body_of(fx.call("GET", "/api/sync/audit"));
  return audit.at("entries").size() == 4;
}

bool test_api_device_flow(TestContext&) {
  ApiFixture fx;
  auto code = fx.call("POST", "/api/sync/device/code", json{{"machineLabel", "laptop"}}, false);
  expect(code.status == 200, "code issued without credentials");
  auto offer = ApiFixture::body_of(code);
  expect(offer.contains("deviceCode") && offer.contains("userCode") && offer.contains("verificationUri"), "offer");
  expect(offer.at("expiresIn") == 900 && offer.at("interval") == 5, "defaults");

  auto device_code = offer.at("deviceCode").get<std::string>();
  auto pending = fx.call("POST", "/api/sync/oauth/token", json{{"deviceCode", device_code}}, false);
  expect(pending.status == 400 && ApiFixture::body_of(pending).at("error") == "authorization_pending", "pending");

  auto bad = fx.call("POST", "/api/sync/device/activate", json{{"userCode", "NOPE"}}, false);
  expect(bad.status == 404, "unknown user code");
  auto activate = fx.call("POST", "/api/sync/device/activate",
                          json{{"userCode", to_lower(offer.at("userCode").get<std::string>())}}, false);
  expect(activate.status == 200, "activated");

  auto token = fx.call("POST", "/api/sync/oauth/token", json{{"deviceCode", device_code}}, false);
  auto grant = ApiFixture::body_of(token);
  expect(token.status == 200 && grant.at("tokenType") == "bearer", "token issued");

  HttpRequest request;
  request.method = "GET";
  request.target = "/api/sync/machines";
  request.set_header("Authorization", "Bearer " + grant.at("accessToken").get<std::string>());
  return fx.api->handle(request).status == 200;
}

} // namespace

void register_wire_tests(std::vector<TestCase>& tests) {
  tests.push_back({"wire_websocket_accept_key", test_websocket_accept_key});
  tests.push_back({"wire_websocket_framing", test_websocket_framing});
  tests.push_back({"wire_http_messages", test_http_messages});
  tests.push_back({"api_requires_credentials", test_api_requires_credentials});
  tests.push_back({"api_ingest_and_list", test_api_ingest_and_list});
  tests.push_back({"api_operator_commands", test_api_operator_commands});
  tests.push_back({"api_device_flow", test_api_device_flow});
}

} // namespace specsync::test
