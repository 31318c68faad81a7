#include "test_runner_utils.hpp"

#include "bridge_config.hpp"
#include "device_auth.hpp"
#include "device_flow.hpp"
#include "event_queue.hpp"
#include "spec_files.hpp"
#include "transport.hpp"

namespace fs = std::filesystem;

namespace specsync::test {
namespace {

constexpr const char* kApiKey = "e2e-key";

std::shared_ptr<SettingsManager> make_server_settings(const TempDir& dir) {
  auto settings = std::make_shared<SettingsManager>(SERVER_SETTINGS_SPECIFICATION);
  configure(settings, "listen_ip", "127.0.0.1");
  configure(settings, "listen_port", 0);
  configure(settings, "state_path", (dir.path() / "server" / "sync_state.json").string());
  configure(settings, "api_key", kApiKey);
  configure(settings, "device_poll_interval", 1);
  configure(settings, "threads", 2);
  return settings;
}

std::shared_ptr<SettingsManager> make_bridge_settings(const TempDir& dir,
                                                      const SyncServer& server,
                                                      const fs::path& project) {
  auto settings = std::make_shared<SettingsManager>(BRIDGE_SETTINGS_SPECIFICATION);
  configure(settings, "server_url", "http://127.0.0.1:" + std::to_string(server.listen_port()));
  configure(settings, "allow_insecure", true);
  configure(settings, "api_key", kApiKey);
  configure(settings, "config_dir", (dir.path() / "bridge").string());
  configure(settings, "project", nlohmann::json::array({project.string()}));
  configure(settings, "label", "e2e-laptop");
  configure(settings, "watch_interval_ms", 100);
  return settings;
}

BridgeAgent::Options fast_bridge_options() {
  BridgeAgent::Options options;
  options.event_heartbeat_interval = std::chrono::seconds(1);
  options.channel.heartbeat_interval = std::chrono::milliseconds(500);
  options.channel.reconnect_delay = std::chrono::milliseconds(200);
  options.channel.connect_timeout = std::chrono::seconds(2);
  options.http_timeout = std::chrono::seconds(2);
  return options;
}

std::optional<SpecRecord> server_spec(const SyncServer& server,
                                      const std::string& machine_id,
                                      const std::string& spec_name) {
  try {
    auto machine = server.registry()->machine(machine_id);
    for(const auto& [id, project] : machine.projects) {
      auto it = project.specs.find(spec_name);
      if(it != project.specs.end()) return it->second;
    }
  } catch(const NotFoundError&) {
    // not registered yet
  }
  return std::nullopt;
}

bool test_snapshot_and_metadata_round_trip(TestContext& ctx) {
  TempDir dir("e2e_sync");
  auto project = dir.path() / "demo";
  write_spec(project, "001-foo", "planned");

  SyncServer server(make_server_settings(dir));
  ctx.logs.attach(server, "server");
  server.start_background();

  BridgeAgent bridge(make_bridge_settings(dir, server, project), fast_bridge_options());
  ctx.logs.attach(bridge, "bridge");
  bridge.start_background();
  const auto machine_id = bridge.identity()->machine_id();

  expect(wait_for_condition([&]{ return server_spec(server, machine_id, "001-foo").has_value(); },
                            std::chrono::seconds(5)),
         "snapshot reached the server");
  expect(server.registry()->machine(machine_id).label == "e2e-laptop", "label reported");
  expect(wait_for_condition([&]{ return bridge.channel()->connected(); }, std::chrono::seconds(5)),
         "command channel connected");

  ApplyMetadataCommand update;
  update.project_id = bridge.projects().front().id;
  update.spec_name = "001-foo";
  update.status = "in-progress";
  update.expected_content_hash = server_spec(server, machine_id, "001-foo")->content_hash;
  server.registry()->enqueue_command(machine_id, SyncCommand{update});

  expect(wait_for_condition([&]{
           auto spec = server_spec(server, machine_id, "001-foo");
           return spec && spec->status == "in-progress";
         }, std::chrono::seconds(5)),
         "status change flowed back");
  expect(wait_for_condition([&]{ return server.registry()->pending_commands(machine_id).empty(); },
                            std::chrono::seconds(5)),
         "command acknowledged");

  auto on_disk = load_spec(project / "specs", "001-foo");
  expect(on_disk && on_disk->scalar("status") == std::optional<std::string>("in-progress"), "file rewritten");

  auto audit = server.registry()->audit_log();
  bool applied = std::any_of(audit.begin(), audit.end(), [](const AuditLogEntry& entry){
    return entry.action == "command_result" && entry.outcome == kResultOk;
  });
  expect(applied, "result audited");

  // a new spec written locally shows up without a restart
  write_spec(project, "002-bar", "planned");
  expect(wait_for_condition([&]{ return server_spec(server, machine_id, "002-bar").has_value(); },
                            std::chrono::seconds(5)),
         "watcher change reached the server");

  bridge.stop();
  expect(bridge.queue()->size() == 0, "nothing left queued");
  server.stop();
  return true;
}

bool test_offline_command_replayed_on_connect(TestContext& ctx) {
  TempDir dir("e2e_offline");
  auto project = dir.path() / "demo";
  write_spec(project, "001-foo", "planned", "priority: low\n");

  // Fix the bridge identity up front so the command can be queued before it
  // ever connects.
  auto config_file = dir.path() / "bridge" / "bridge.json";
  auto config = load_bridge_config(config_file);
  config.machine_label = "offline-box";
  save_bridge_config(config_file, config);
  auto project_id = build_project_config(project, config.machine_id).id;

  SyncServer server(make_server_settings(dir));
  ctx.logs.attach(server, "server");
  server.start_background();
  server.registry()->ensure_machine(config.machine_id, config.machine_label);

  ApplyMetadataCommand update;
  update.project_id = project_id;
  update.spec_name = "001-foo";
  update.priority = "high";
  server.registry()->enqueue_command(config.machine_id, SyncCommand{update});
  expect(server.registry()->pending_commands(config.machine_id).size() == 1, "queued while offline");

  auto settings = make_bridge_settings(dir, server, project);
  configure(settings, "label", "");
  BridgeAgent bridge(settings, fast_bridge_options());
  ctx.logs.attach(bridge, "bridge");
  bridge.start_background();
  expect(bridge.identity()->machine_id() == config.machine_id, "identity reused");

  expect(wait_for_condition([&]{ return server.registry()->pending_commands(config.machine_id).empty(); },
                            std::chrono::seconds(5)),
         "replayed on connect");
  auto on_disk = load_spec(project / "specs", "001-foo");
  expect(on_disk && on_disk->scalar("priority") == std::optional<std::string>("high"), "priority applied");
  expect(wait_for_condition([&]{
           auto spec = server_spec(server, config.machine_id, "001-foo");
           return spec && spec->priority == std::optional<std::string>("high");
         }, std::chrono::seconds(5)),
         "server sees the new priority");

  bridge.stop();
  server.stop();
  return true;
}

bool test_device_flow_over_http(TestContext& ctx) {
  TempDir dir("e2e_device");
  SyncServer server(make_server_settings(dir));
  ctx.logs.attach(server, "server");
  server.start_background();

  auto url = parse_server_url("http://127.0.0.1:" + std::to_string(server.listen_port()));
  auto http = std::make_shared<HttpClient>(url, nullptr, std::chrono::seconds(2));
  auto logger = std::make_shared<Logger>("device-flow");
  ctx.logs.attach(logger, "client");
  DeviceFlowClient flow(http, logger, [](std::chrono::milliseconds){});

  auto offer = flow.request_code("ci-runner");
  expect(!offer.device_code.empty() && !offer.user_code.empty(), "code issued");
  expect(offer.interval == 1, "poll interval advertised");
  expect(!flow.poll_once(offer).has_value(), "pending before activation");

  HttpRequest activate;
  activate.method = "POST";
  activate.target = "/api/sync/device/activate";
  activate.set_header("content-type", "application/json");
  activate.body = nlohmann::json{{"userCode", offer.user_code}}.dump();
  expect(http->send(activate).status == 200, "activated");

  auto token = flow.poll_once(offer);
  expect(token.has_value() && !token->empty(), "token after activation");

  HttpRequest list;
  list.method = "GET";
  list.target = "/api/sync/machines";
  list.set_header("authorization", "Bearer " + *token);
  expect(http->send(list).status == 200, "token accepted");
  list.set_header("authorization", "Bearer not-a-token");
  expect(http->send(list).status == 401, "unknown token refused");

  std::atomic<bool> cancelled{true};
  expect(!flow.authorize("ci-runner", cancelled).has_value(), "cancelled flow returns nothing");

  server.stop();
  return true;
}

} // namespace

void register_end_to_end_tests(std::vector<TestCase>& tests) {
  tests.push_back({"e2e_snapshot_and_metadata_round_trip", test_snapshot_and_metadata_round_trip});
  tests.push_back({"e2e_offline_command_replayed_on_connect", test_offline_command_replayed_on_connect});
  tests.push_back({"e2e_device_flow_over_http", test_device_flow_over_http});
}

} // namespace specsync::test
