#include "sync_api.hpp"

#include <utility>

#include "protocol.hpp"
#include "utils.hpp"

namespace {

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while(start < path.size()) {
    auto slash = path.find('/', start);
    auto end = slash == std::string::npos ? path.size() : slash;
    if(end > start) out.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

json parse_body(const HttpRequest& request) {
  if(request.body.empty()) return json::object();
  try {
    auto doc = json::parse(request.body);
    if(!doc.is_object()) throw ValidationError("request body must be a JSON object");
    return doc;
  } catch(const json::exception& e) {
    throw ValidationError(std::string("malformed JSON body: ") + e.what());
  }
}

std::string body_string(const json& body, const char* key) {
  auto it = body.find(key);
  if(it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw ValidationError(std::string("field '") + key + "' is required");
  }
  return it->get<std::string>();
}

HttpResponse ok_json(const json& body, int status = 200) {
  return make_json_response(status, dump_json(body));
}

HttpResponse method_not_allowed() {
  return SyncApi::error_response(SyncError(ErrorKind::Validation, "method not allowed", "method_not_allowed"));
}

} // namespace

SyncApi::SyncApi(std::shared_ptr<MachineRegistry> registry,
                 std::shared_ptr<DeviceAuthService> device_auth,
                 Options options,
                 std::shared_ptr<Logger> logger)
  : registry_(std::move(registry)),
    device_auth_(std::move(device_auth)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-api")) {}

HttpResponse SyncApi::error_response(const SyncError& error) {
  auto response = make_json_response(error.http_status(),
                                     dump_json(make_error_body(error.code(), error.what())));
  if(error.code() == "method_not_allowed") {
    response.status = 405;
  } else if(error.code() == "upgrade_required") {
    response.status = 426;
  }
  return response;
}

void SyncApi::authorize(const HttpRequest& request) const {
  if(auto key = request.header("x-api-key")) {
    if(!options_.api_key.empty() && *key == options_.api_key) return;
  }
  if(auto auth = request.header("authorization")) {
    const std::string prefix = "Bearer ";
    if(auth->size() > prefix.size() && iequals(auth->substr(0, prefix.size()), prefix)) {
      if(registry_->validate_token(trim_copy(auth->substr(prefix.size())))) return;
    }
  }
  throw AuthError("Missing or invalid sync token");
}

HttpResponse SyncApi::handle(const HttpRequest& request) {
  try {
    auto response = route(request, split_path(request.path()));
    logger_->debug("{} {} -> {}", request.method, request.path(), response.status);
    return response;
  } catch(const SyncError& e) {
    if(e.kind() == ErrorKind::Internal) {
      logger_->error("{} {} failed: {}", request.method, request.path(), e.what());
    } else {
      logger_->debug("{} {} -> {} ({})", request.method, request.path(), e.http_status(), e.what());
    }
    return error_response(e);
  } catch(const std::exception& e) {
    logger_->error("{} {} failed: {}", request.method, request.path(), e.what());
    return error_response(SyncError(ErrorKind::Internal, e.what()));
  }
}

HttpResponse SyncApi::route(const HttpRequest& request, const std::vector<std::string>& seg) {
  const auto& m = request.method;
  if(seg.size() < 3 || seg[0] != "api" || seg[1] != "sync") {
    throw NotFoundError("no route for " + request.path());
  }
  const auto n = seg.size();

  if(n == 3 && seg[2] == "events") {
    if(m != "POST") return method_not_allowed();
    return post_events(request);
  }
  if(n == 3 && seg[2] == "audit") {
    if(m != "GET") return method_not_allowed();
    return get_audit(request);
  }
  if(n == 4 && seg[2] == "device" && seg[3] == "code") {
    if(m != "POST") return method_not_allowed();
    return post_device_code(request);
  }
  if(n == 4 && seg[2] == "device" && seg[3] == "activate") {
    if(m != "POST") return method_not_allowed();
    return post_device_activate(request);
  }
  if(n == 4 && seg[2] == "oauth" && seg[3] == "token") {
    if(m != "POST") return method_not_allowed();
    return post_token(request);
  }
  if(n == 4 && seg[2] == "bridge" && seg[3] == "ws") {
    // Reached only when the upgrade headers were missing.
    throw SyncError(ErrorKind::Validation, "websocket upgrade required", "upgrade_required");
  }
  if(seg[2] == "machines") {
    if(n == 3) {
      if(m != "GET") return method_not_allowed();
      return get_machines(request);
    }
    if(n == 4) {
      if(m == "GET") return get_machine(request, seg[3]);
      if(m == "PATCH") return patch_machine(request, seg[3]);
      if(m == "DELETE") return delete_machine(request, seg[3]);
      return method_not_allowed();
    }
    if(n == 5 && seg[4] == "execution") {
      if(m != "POST") return method_not_allowed();
      return post_execution(request, seg[3]);
    }
    if(n == 5 && seg[4] == "metadata") {
      if(m != "POST") return method_not_allowed();
      return post_metadata(request, seg[3]);
    }
  }
  throw NotFoundError("no route for " + request.path());
}

HttpResponse SyncApi::post_events(const HttpRequest& request) {
  authorize(request);
  // Decoding validates the whole batch (including every content hash)
  // before the registry is touched.
  auto batch = decode_message<SyncEventsRequest>(request.body);
  registry_->ensure_machine(batch.machine_id, batch.machine_label);
  registry_->ingest_events(batch);
  return ok_json(make_success_ack());
}

HttpResponse SyncApi::post_device_code(const HttpRequest& request) {
  auto body = parse_body(request);
  if(auto label = body.find("machineLabel"); label != body.end() && label->is_string()) {
    logger_->info("Device code requested by '{}'", label->get<std::string>());
  }
  json out = device_auth_->request_device_code();
  return ok_json(out);
}

HttpResponse SyncApi::post_device_activate(const HttpRequest& request) {
  auto body = parse_body(request);
  device_auth_->activate(body_string(body, "userCode"));
  return ok_json(make_success_ack());
}

HttpResponse SyncApi::post_token(const HttpRequest& request) {
  auto body = parse_body(request);
  auto grant = device_auth_->exchange(body_string(body, "deviceCode"));
  if(!grant) {
    throw ValidationError("authorization_pending", "authorization_pending");
  }
  json out = *grant;
  return ok_json(out);
}

HttpResponse SyncApi::get_machines(const HttpRequest& request) {
  authorize(request);
  json machines = registry_->list_machines();
  return ok_json(json{{"machines", machines}});
}

HttpResponse SyncApi::get_machine(const HttpRequest& request, const std::string& id) {
  authorize(request);
  json out = registry_->machine(id);
  return ok_json(out);
}

HttpResponse SyncApi::patch_machine(const HttpRequest& request, const std::string& id) {
  authorize(request);
  auto body = parse_body(request);
  json summary = registry_->rename_machine(id, body_string(body, "label"));
  return ok_json(summary);
}

HttpResponse SyncApi::delete_machine(const HttpRequest& request, const std::string& id) {
  authorize(request);
  registry_->revoke_machine(id);
  HttpResponse response;
  response.status = 204;
  return response;
}

HttpResponse SyncApi::post_execution(const HttpRequest& request, const std::string& id) {
  authorize(request);
  auto body = parse_body(request);
  auto payload = body.contains("payload") ? body.at("payload") : json(nullptr);
  auto pending = registry_->request_execution(id, std::move(payload));
  return ok_json(json{{"success", true}, {"commandId", pending.id}});
}

HttpResponse SyncApi::post_metadata(const HttpRequest& request, const std::string& id) {
  authorize(request);
  auto body = parse_body(request);
  body["type"] = "apply_metadata";
  SyncCommand command;
  try {
    command = body.get<SyncCommand>();
  } catch(const json::exception& e) {
    throw ValidationError(std::string("malformed metadata update: ") + e.what());
  }
  auto pending = registry_->enqueue_command(id, std::move(command));
  return ok_json(json{{"success", true}, {"commandId", pending.id}});
}

HttpResponse SyncApi::get_audit(const HttpRequest& request) {
  authorize(request);
  json entries = registry_->audit_log();
  return ok_json(json{{"entries", entries}});
}
