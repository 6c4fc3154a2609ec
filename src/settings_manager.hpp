#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","api_url"},      {"aliases", {"url"}},             {"type","string"}, {"default","https://darwin.v7labs.com"}, {"description","Base URL of the dataset service"}, {"persistent", true}},
  {{"key","default_team"}, {"aliases", {"team","t"}},        {"type","string"}, {"default",""},    {"description","Team used when a dataset reference names none"}, {"persistent", true}},
  {{"key","teams"},        {"aliases", nlohmann::json::array()}, {"type","json"},   {"default",nlohmann::json::object()}, {"description","Per-team credentials: slug -> {api_key, datasets_dir}"}, {"persistent", true}},
  {{"key","max_workers"},  {"aliases", {"workers","j"}},     {"type","int"},    {"default",4},     {"description","Concurrent upload/download transfers"}, {"persistent", true}},
  {{"key","fps"},          {"aliases", {"frame_rate"}},      {"type","float"},  {"default",1.0},   {"description","Frames per second extracted from videos on push"}, {"persistent", true}},
  {{"key","log_file"},     {"aliases", {"log"}},             {"type","string"}, {"default",""},    {"description","Also write log output to this file"}, {"persistent", true}},
  {{"key","verbose"},      {"aliases", {"v"}},               {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","yes"},          {"aliases", {"y"}},               {"type","bool"},   {"default",false}, {"description","Answer yes to confirmation prompts"}, {"persistent", false}},
  {{"key","help"},         {"aliases", {"h","?"}},           {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},         {"aliases", {"persist"}},         {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

struct TeamCredentials {
  std::string slug;
  std::string api_key;
  std::filesystem::path datasets_dir;
};

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return settings_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string describe(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);
  static std::filesystem::path default_config_root();

  // Team registry kept under "teams".
  std::vector<TeamCredentials> teams() const;
  std::optional<TeamCredentials> team(const std::string& slug) const;
  void store_team(const TeamCredentials& credentials);

  nlohmann::json get_json(bool persistent_only = true) const;

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> specs_;
  std::filesystem::path settings_path_override_;
};
