#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Each entry: key, aliases, type (bool|int|string|list|json), default,
// description, persistent. "list" settings append on every occurrence on the
// command line. Option tokens accept '-' or '_' as word separators.

inline const nlohmann::json BRIDGE_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_url"},        {"aliases", {"server","s"}},   {"type","string"}, {"default","http://localhost:3333"}, {"description","Sync server base URL"}, {"persistent", true}},
  {{"key","api_key"},           {"aliases", {"key"}},          {"type","string"}, {"default",""},         {"description","API key for headless/CI auth (skips device login)"}, {"persistent", true}},
  {{"key","project"},           {"aliases", {"p"}},            {"type","list"},   {"default",nlohmann::json::array()}, {"description","Project root to sync (repeatable)"}, {"persistent", true}},
  {{"key","label"},             {"aliases", {"l"}},            {"type","string"}, {"default",""},         {"description","Machine label (defaults to hostname)"}, {"persistent", true}},
  {{"key","allow_insecure"},    {"aliases", {"insecure"}},     {"type","bool"},   {"default",false},      {"description","Permit plain http (no TLS)"}, {"persistent", true}},
  {{"key","config_dir"},        {"aliases", {"c"}},            {"type","string"}, {"default",""},         {"description","Directory for bridge.json, queue and audit log (default ~/.specsync)"}, {"persistent", false}},
  {{"key","watch_interval_ms"}, {"aliases", {"wi"}},           {"type","int"},    {"default",1000},       {"description","Spec directory poll interval in milliseconds"}, {"persistent", true}},
  {{"key","verbose"},           {"aliases", {"v"}},            {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},              {"aliases", {"h","?"}},        {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}}
});

inline const nlohmann::json SERVER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_ip"},             {"aliases", {"li"}},        {"type","string"}, {"default","0.0.0.0"},  {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},           {"aliases", {"lp"}},        {"type","int"},    {"default",3333},       {"description","TCP port to listen on"}, {"persistent", true}},
  {{"key","state_path"},            {"aliases", {"state"}},     {"type","string"}, {"default",""},         {"description","Registry state file (default ~/.specsync/sync_state.json)"}, {"persistent", true}},
  {{"key","api_key"},               {"aliases", {"key"}},       {"type","string"}, {"default",""},         {"description","Shared API key accepted in x-api-key (or SPECSYNC_API_KEY)"}, {"persistent", true}},
  {{"key","verification_url"},      {"aliases", {"vu"}},        {"type","string"}, {"default","http://localhost:3333/device"}, {"description","URL shown to users for device activation"}, {"persistent", true}},
  {{"key","device_code_ttl"},       {"aliases", {"dct"}},       {"type","int"},    {"default",900},        {"description","Device code lifetime in seconds"}, {"persistent", true}},
  {{"key","device_poll_interval"},  {"aliases", {"dpi"}},       {"type","int"},    {"default",5},          {"description","Polling interval advertised to bridges in seconds"}, {"persistent", true}},
  {{"key","token_ttl"},             {"aliases", {"tt"}},        {"type","int"},    {"default",0},          {"description","Access token lifetime in seconds (0 = never expires)"}, {"persistent", true}},
  {{"key","online_window"},         {"aliases", {"ow"}},        {"type","int"},    {"default",30},         {"description","Seconds since last contact a machine still counts as online"}, {"persistent", true}},
  {{"key","threads"},               {"aliases", {"t"}},         {"type","int"},    {"default",2},          {"description","I/O worker threads"}, {"persistent", true}},
  {{"key","verbose"},               {"aliases", {"v"}},         {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},     {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},   {"type","bool"},   {"default",false},      {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;
  const nlohmann::json& specification() const { return specification_; }

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  static std::string normalize_token(const std::string& token);
  const SettingSpec* find_spec(const std::string& token) const;

  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline std::string SettingsManager::normalize_token(const std::string& token) {
  std::string out = to_lower(token);
  std::replace(out.begin(), out.end(), '-', '_');
  return out;
}

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases").get<std::vector<std::string>>()) {
        spec.aliases.push_back(normalize_token(alias));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    settings_(nlohmann::json::object()),
    setting_specs_(build_setting_specs(specification)) {
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string normalized = normalize_token(token);
  for(const auto& spec : setting_specs_) {
    if(normalized == spec.key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), normalized) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err("Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err("Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "list") {
    // a bare string appends, an array replaces
    if(value.is_string()) {
      settings_[spec.key].push_back(value.get<std::string>());
      return true;
    }
    if(value.is_array() && std::all_of(value.begin(), value.end(),
                                       [](const nlohmann::json& v){ return v.is_string(); })) {
      settings_[spec.key] = value;
      return true;
    }
    error = "expected string or array of strings";
    return false;
  }
  if(spec.type == "json") {
    settings_[spec.key] = value;
    return true;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters after integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "list") {
    return clean;
  }
  if(spec.type == "json") {
    try {
      return nlohmann::json::parse(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
