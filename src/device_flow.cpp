#include "device_flow.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include "protocol.hpp"
#include "transport.hpp"

namespace {

std::string error_code_of(const HttpResponse& response) {
  try {
    auto body = json::parse(response.body);
    return body.value("error", std::string());
  } catch(const json::exception&) {
    return {};
  }
}

} // namespace

DeviceFlowClient::DeviceFlowClient(std::shared_ptr<HttpClient> client,
                                   std::shared_ptr<Logger> logger,
                                   Sleeper sleeper)
  : client_(std::move(client)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("device-flow")),
    sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); })) {}

DeviceCodeOffer DeviceFlowClient::request_code(const std::string& machine_label) {
  auto response = client_->post_json("/api/sync/device/code", json{{"machineLabel", machine_label}});
  if(response.status != 200) {
    throw TransportError("device code request failed with status " + std::to_string(response.status));
  }
  try {
    auto body = json::parse(response.body);
    DeviceCodeOffer offer;
    offer.device_code = body.at("deviceCode").get<std::string>();
    offer.user_code = body.at("userCode").get<std::string>();
    offer.verification_uri = body.at("verificationUri").get<std::string>();
    offer.expires_in = body.value("expiresIn", std::int64_t{0});
    offer.interval = std::max<std::int64_t>(1, body.value("interval", std::int64_t{5}));
    return offer;
  } catch(const json::exception& e) {
    throw ValidationError(std::string("malformed device code response: ") + e.what());
  }
}

std::optional<std::string> DeviceFlowClient::poll_once(const DeviceCodeOffer& offer) {
  auto response = client_->post_json("/api/sync/oauth/token", json{{"deviceCode", offer.device_code}});
  if(response.status == 200) {
    try {
      auto body = json::parse(response.body);
      if(body.contains("accessToken") && body.at("accessToken").is_string()) {
        return body.at("accessToken").get<std::string>();
      }
    } catch(const json::exception& e) {
      throw ValidationError(std::string("malformed token response: ") + e.what());
    }
    throw ValidationError("token response has no accessToken");
  }
  auto code = error_code_of(response);
  if(code == "authorization_pending" || code == "slow_down") {
    return std::nullopt;
  }
  if(code == "expired_token" || response.status == 404) {
    throw ValidationError("device code expired", "expired_token");
  }
  throw TransportError("token exchange failed with status " + std::to_string(response.status));
}

std::optional<std::string> DeviceFlowClient::authorize(const std::string& machine_label,
                                                       const std::atomic<bool>& cancelled) {
  const auto retry_delay = std::chrono::seconds(5);
  while(!cancelled) {
    DeviceCodeOffer offer;
    try {
      offer = request_code(machine_label);
    } catch(const SyncError& e) {
      logger_->warn("Unable to start device login: {}", e.what());
      sleeper_(retry_delay);
      continue;
    }
    logger_->print("Open {} and enter code {}", offer.verification_uri, offer.user_code);

    bool expired = false;
    while(!cancelled && !expired) {
      sleeper_(std::chrono::seconds(offer.interval));
      if(cancelled) break;
      try {
        if(auto token = poll_once(offer)) {
          logger_->info("Device authorized");
          return token;
        }
      } catch(const ValidationError& e) {
        if(e.code() != "expired_token") throw;
        logger_->warn("Device code expired, requesting a new one");
        expired = true;
      } catch(const TransportError& e) {
        logger_->debug("Token poll failed: {}", e.what());
      }
    }
  }
  return std::nullopt;
}
