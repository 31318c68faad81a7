#pragma once

#include <memory>
#include <string>
#include <vector>

#include "device_auth.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "machine_registry.hpp"
#include "sync_error.hpp"

// Request router for /api/sync/*. handle() never throws: every SyncError is
// rendered as {error, message} with its mapped status.
class SyncApi {
public:
  struct Options {
    std::string api_key;  // empty = only bearer tokens are accepted
  };

  SyncApi(std::shared_ptr<MachineRegistry> registry,
          std::shared_ptr<DeviceAuthService> device_auth,
          Options options,
          std::shared_ptr<Logger> logger = nullptr);

  HttpResponse handle(const HttpRequest& request);

  // x-api-key matching the configured key, or a live bearer token.
  void authorize(const HttpRequest& request) const;

  static HttpResponse error_response(const SyncError& error);

private:
  HttpResponse route(const HttpRequest& request, const std::vector<std::string>& segments);

  HttpResponse post_events(const HttpRequest& request);
  HttpResponse post_device_code(const HttpRequest& request);
  HttpResponse post_device_activate(const HttpRequest& request);
  HttpResponse post_token(const HttpRequest& request);
  HttpResponse get_machines(const HttpRequest& request);
  HttpResponse get_machine(const HttpRequest& request, const std::string& id);
  HttpResponse patch_machine(const HttpRequest& request, const std::string& id);
  HttpResponse delete_machine(const HttpRequest& request, const std::string& id);
  HttpResponse post_execution(const HttpRequest& request, const std::string& id);
  HttpResponse post_metadata(const HttpRequest& request, const std::string& id);
  HttpResponse get_audit(const HttpRequest& request);

  std::shared_ptr<MachineRegistry> registry_;
  std::shared_ptr<DeviceAuthService> device_auth_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
