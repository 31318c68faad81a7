#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sync_error.hpp"

// Unrecoverable local misconfiguration; the bridge exits on it.
struct ConfigError : SyncError {
  explicit ConfigError(const std::string& message)
    : SyncError(ErrorKind::Validation, message, "config_error") {}
};

struct ProjectConfig {
  std::string id;
  std::string name;
  std::filesystem::path path;
  std::filesystem::path specs_dir;
};

struct BridgeConfig {
  std::string server_url = "http://localhost:3333";
  std::optional<std::string> api_key;
  std::optional<std::string> access_token;
  std::string machine_id;
  std::string machine_label;
  std::vector<ProjectConfig> projects;
};

void to_json(nlohmann::json& j, const ProjectConfig& project);
void from_json(const nlohmann::json& j, ProjectConfig& project);
void to_json(nlohmann::json& j, const BridgeConfig& config);
void from_json(const nlohmann::json& j, BridgeConfig& config);

std::string default_machine_label();

// Reads bridge.json, or returns a fresh identity when it does not exist. A
// missing machine id or label is filled in. Throws ConfigError on a corrupt
// file.
BridgeConfig load_bridge_config(const std::filesystem::path& file);
void save_bridge_config(const std::filesystem::path& file, const BridgeConfig& config);

// First of specs, .lean-spec/specs, docs/specs, doc/specs, then the specsDir
// named in .lean-spec/config.json.
std::optional<std::filesystem::path> find_specs_dir(const std::filesystem::path& project_root);

// Throws ConfigError when the path or its specs directory does not exist.
ProjectConfig build_project_config(const std::filesystem::path& project_root,
                                   const std::string& machine_id);

// The bridge's identity, shared by every task. Everything but the label and
// the access token is fixed after startup; those two change through commands
// and are written back to bridge.json.
class BridgeIdentity {
public:
  BridgeIdentity(std::filesystem::path file, BridgeConfig config);

  BridgeConfig snapshot() const;
  const std::string& machine_id() const { return machine_id_; }
  std::string server_url() const;
  std::string label() const;
  std::optional<std::string> api_key() const;
  std::optional<std::string> access_token() const;
  const std::filesystem::path& file() const { return file_; }

  void set_label(const std::string& label);
  void set_access_token(std::optional<std::string> token);
  void save() const;

private:
  std::filesystem::path file_;
  std::string machine_id_;
  mutable std::mutex mutex_;
  mutable std::mutex save_mutex_;  // orders writes of bridge.json
  BridgeConfig config_;
};
