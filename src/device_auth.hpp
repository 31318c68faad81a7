#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "log.hpp"
#include "machine_registry.hpp"

struct DeviceCodeRecord {
  std::string device_code;
  std::string user_code;
  SystemTime expires_at;
  std::chrono::seconds interval{5};
  bool approved = false;
  std::optional<AccessToken> access_token;
};

struct DeviceCodeGrant {
  std::string device_code;
  std::string user_code;
  std::string verification_uri;
  std::chrono::seconds expires_in{0};
  std::chrono::seconds interval{0};
};

struct TokenGrant {
  std::string access_token;
  std::string token_type = "bearer";
  std::optional<std::chrono::seconds> expires_in;
};

void to_json(json& j, const DeviceCodeGrant& grant);
void to_json(json& j, const TokenGrant& grant);

// Device authorization grant: request -> activate (operator) -> exchange
// (bridge). Codes live in memory; minted tokens go to the registry's table.
class DeviceAuthService {
public:
  struct Options {
    std::string verification_url = "http://localhost:3333/device";
    std::chrono::seconds device_code_ttl{900};
    std::chrono::seconds poll_interval{5};
    std::chrono::seconds token_ttl{0};  // 0 = tokens never expire
  };

  DeviceAuthService(std::shared_ptr<MachineRegistry> registry,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);

  DeviceCodeGrant request_device_code();

  // Throws NotFoundError for an unknown code, ValidationError("expired_token")
  // once the code has expired. Repeat activation returns the same token.
  AccessToken activate(const std::string& user_code);

  // std::nullopt while the code is still waiting for activation.
  std::optional<TokenGrant> exchange(const std::string& device_code);

  std::size_t outstanding_codes() const;

private:
  void purge_expired_locked(SystemTime now);

  std::shared_ptr<MachineRegistry> registry_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, DeviceCodeRecord> codes_;
};
