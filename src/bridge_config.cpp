#include "bridge_config.hpp"

#include <system_error>

#include "spec_files.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

void to_json(json& j, const ProjectConfig& project) {
  j = json{{"id", project.id},
           {"name", project.name},
           {"path", project.path.string()},
           {"specsDir", project.specs_dir.string()}};
}

void from_json(const json& j, ProjectConfig& project) {
  project.id = j.at("id").get<std::string>();
  project.name = j.at("name").get<std::string>();
  project.path = j.at("path").get<std::string>();
  project.specs_dir = j.at("specsDir").get<std::string>();
}

void to_json(json& j, const BridgeConfig& config) {
  j = json{{"serverUrl", config.server_url},
           {"machineId", config.machine_id},
           {"machineLabel", config.machine_label},
           {"projects", config.projects}};
  j["apiKey"] = config.api_key ? json(*config.api_key) : json(nullptr);
  j["accessToken"] = config.access_token ? json(*config.access_token) : json(nullptr);
}

void from_json(const json& j, BridgeConfig& config) {
  config.server_url = j.value("serverUrl", std::string("http://localhost:3333"));
  config.api_key.reset();
  config.access_token.reset();
  if(j.contains("apiKey") && j.at("apiKey").is_string()) {
    config.api_key = j.at("apiKey").get<std::string>();
  }
  if(j.contains("accessToken") && j.at("accessToken").is_string()) {
    config.access_token = j.at("accessToken").get<std::string>();
  }
  config.machine_id = j.value("machineId", std::string());
  config.machine_label = j.value("machineLabel", std::string());
  config.projects = j.value("projects", std::vector<ProjectConfig>{});
}

std::string default_machine_label() {
  auto host = local_hostname();
  return host.empty() ? std::string("SpecSync Machine") : host;
}

BridgeConfig load_bridge_config(const fs::path& file) {
  BridgeConfig config;
  std::error_code ec;
  if(fs::exists(file, ec)) {
    try {
      config = json::parse(read_file(file)).get<BridgeConfig>();
    } catch(const json::exception& e) {
      throw ConfigError("Corrupt bridge config " + file.string() + ": " + e.what());
    }
  }
  if(!is_uuid(config.machine_id)) {
    config.machine_id = uuid_v4();
  }
  if(config.machine_label.empty()) {
    config.machine_label = default_machine_label();
  }
  return config;
}

void save_bridge_config(const fs::path& file, const BridgeConfig& config) {
  std::error_code ec;
  if(file.has_parent_path()) {
    fs::create_directories(file.parent_path(), ec);
    if(ec) {
      throw SyncError(ErrorKind::Internal, "unable to create " + file.parent_path().string() + ": " + ec.message());
    }
  }
  write_file_atomic(file, dump_json(json(config), 2));
}

std::optional<fs::path> find_specs_dir(const fs::path& project_root) {
  std::error_code ec;
  for(const char* candidate : {"specs", ".lean-spec/specs", "docs/specs", "doc/specs"}) {
    auto path = project_root / candidate;
    if(fs::is_directory(path, ec)) return path;
  }
  auto config_file = project_root / ".lean-spec" / "config.json";
  if(!fs::is_regular_file(config_file, ec)) return std::nullopt;
  try {
    auto doc = json::parse(read_file(config_file));
    if(doc.contains("specsDir") && doc.at("specsDir").is_string()) {
      auto path = project_root / doc.at("specsDir").get<std::string>();
      if(fs::is_directory(path, ec)) return path;
    }
  } catch(const json::exception&) {
    return std::nullopt;
  }
  return std::nullopt;
}

ProjectConfig build_project_config(const fs::path& project_root, const std::string& machine_id) {
  std::error_code ec;
  auto root = fs::absolute(project_root, ec);
  if(ec || !fs::exists(root, ec)) {
    throw ConfigError("Project path not found: " + project_root.string());
  }
  root = root.lexically_normal();
  if(!root.has_filename() && root.has_parent_path()) {
    root = root.parent_path();
  }
  auto specs_dir = find_specs_dir(root);
  if(!specs_dir) {
    throw ConfigError("specs directory not found for " + project_root.string());
  }

  ProjectConfig project;
  project.path = root;
  project.specs_dir = *specs_dir;
  project.name = root.filename().string();
  if(project.name.empty()) project.name = "SpecSync Project";
  project.id = uuid_v5(is_uuid(machine_id) ? machine_id : uuid_v4(), root.string());
  return project;
}

BridgeIdentity::BridgeIdentity(fs::path file, BridgeConfig config)
  : file_(std::move(file)), machine_id_(config.machine_id), config_(std::move(config)) {}

BridgeConfig BridgeIdentity::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

std::string BridgeIdentity::server_url() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.server_url;
}

std::string BridgeIdentity::label() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.machine_label;
}

std::optional<std::string> BridgeIdentity::api_key() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.api_key;
}

std::optional<std::string> BridgeIdentity::access_token() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.access_token;
}

void BridgeIdentity::set_label(const std::string& label) {
  std::lock_guard<std::mutex> save_lock(save_mutex_);
  BridgeConfig copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.machine_label = label;
    copy = config_;
  }
  save_bridge_config(file_, copy);
}

void BridgeIdentity::set_access_token(std::optional<std::string> token) {
  std::lock_guard<std::mutex> save_lock(save_mutex_);
  BridgeConfig copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.access_token = std::move(token);
    copy = config_;
  }
  save_bridge_config(file_, copy);
}

void BridgeIdentity::save() const {
  std::lock_guard<std::mutex> save_lock(save_mutex_);
  save_bridge_config(file_, snapshot());
}
