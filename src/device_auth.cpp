#include "device_auth.hpp"

#include <algorithm>
#include <utility>

#include "sync_error.hpp"
#include "utils.hpp"

void to_json(json& j, const DeviceCodeGrant& grant) {
  j = json{{"deviceCode", grant.device_code},
           {"userCode", grant.user_code},
           {"verificationUri", grant.verification_uri},
           {"expiresIn", grant.expires_in.count()},
           {"interval", grant.interval.count()}};
}

void to_json(json& j, const TokenGrant& grant) {
  j = json{{"accessToken", grant.access_token},
           {"tokenType", grant.token_type},
           {"expiresIn", grant.expires_in ? json(grant.expires_in->count()) : json(nullptr)}};
}

DeviceAuthService::DeviceAuthService(std::shared_ptr<MachineRegistry> registry,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : registry_(std::move(registry)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("device-auth")) {
  if(options_.poll_interval.count() <= 0) {
    options_.poll_interval = std::chrono::seconds(5);
  }
}

void DeviceAuthService::purge_expired_locked(SystemTime now) {
  // Expired codes stay around for one extra TTL so a late exchange still gets
  // "expired" rather than "not found".
  for(auto it = codes_.begin(); it != codes_.end();) {
    if(it->second.expires_at + options_.device_code_ttl < now) {
      it = codes_.erase(it);
    } else {
      ++it;
    }
  }
}

DeviceCodeGrant DeviceAuthService::request_device_code() {
  auto now = registry_->now();
  DeviceCodeRecord record;
  record.device_code = uuid_v4();
  record.expires_at = now + options_.device_code_ttl;
  record.interval = options_.poll_interval;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(now);
    do {
      record.user_code = to_upper(hex_from_bytes(random_bytes(4)));
    } while(std::any_of(codes_.begin(), codes_.end(),
                        [&](const auto& item){ return item.second.user_code == record.user_code; }));
    codes_[record.device_code] = record;
  }

  logger_->info("Issued device code, user code {} (expires in {}s)",
                record.user_code, options_.device_code_ttl.count());
  return DeviceCodeGrant{record.device_code, record.user_code, options_.verification_url,
                         options_.device_code_ttl, options_.poll_interval};
}

AccessToken DeviceAuthService::activate(const std::string& user_code) {
  auto wanted = trim_copy(user_code);
  auto now = registry_->now();
  AccessToken token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(codes_.begin(), codes_.end(),
                           [&](const auto& item){ return iequals(item.second.user_code, wanted); });
    if(it == codes_.end()) {
      throw NotFoundError("Invalid user code");
    }
    auto& record = it->second;
    if(record.expires_at < now) {
      throw ValidationError("Device code expired", "expired_token");
    }
    if(record.access_token) {
      return *record.access_token;
    }
    token.token = uuid_v4();
    token.issued_at = now;
    if(options_.token_ttl.count() > 0) {
      token.expires_at = now + options_.token_ttl;
    }
    record.approved = true;
    record.access_token = token;
  }
  registry_->store_token(token);
  logger_->info("Device code {} approved", to_upper(wanted));
  return token;
}

std::optional<TokenGrant> DeviceAuthService::exchange(const std::string& device_code) {
  auto now = registry_->now();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = codes_.find(device_code);
  if(it == codes_.end()) {
    throw NotFoundError("Device code not found");
  }
  const auto& record = it->second;
  if(record.expires_at < now) {
    throw ValidationError("Device code expired", "expired_token");
  }
  if(!record.approved || !record.access_token) {
    return std::nullopt;
  }
  TokenGrant grant;
  grant.access_token = record.access_token->token;
  if(record.access_token->expires_at) {
    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*record.access_token->expires_at - now);
    grant.expires_in = std::max(remaining, std::chrono::seconds(0));
  }
  return grant;
}

std::size_t DeviceAuthService::outstanding_codes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_.size();
}
