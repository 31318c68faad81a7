#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"

class HttpClient;

struct DeviceCodeOffer {
  std::string device_code;
  std::string user_code;
  std::string verification_uri;
  std::int64_t expires_in = 0;
  std::int64_t interval = 5;
};

// Client half of the device authorization flow: request a code, show it to
// the user, poll until the code is activated and exchange it for a token.
class DeviceFlowClient {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  DeviceFlowClient(std::shared_ptr<HttpClient> client,
                   std::shared_ptr<Logger> logger,
                   Sleeper sleeper = {});

  DeviceCodeOffer request_code(const std::string& machine_label);

  // std::nullopt while authorization is pending. Throws ValidationError with
  // code "expired_token" once the code has expired.
  std::optional<std::string> poll_once(const DeviceCodeOffer& offer);

  // Runs the whole flow, requesting a fresh code whenever one expires.
  // Returns the access token, or std::nullopt when `cancelled` becomes true.
  std::optional<std::string> authorize(const std::string& machine_label, const std::atomic<bool>& cancelled);

private:
  std::shared_ptr<HttpClient> client_;
  std::shared_ptr<Logger> logger_;
  Sleeper sleeper_;
};
