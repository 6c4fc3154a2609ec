#include "settings_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    settings_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::string SettingsManager::describe(const std::string& key) const {
  const auto* spec = find_spec(key);
  if(!spec) return std::string();
  std::string aliases;
  for(const auto& alias : spec->aliases) {
    aliases += aliases.empty() ? " (alias: -" : ", -";
    aliases += alias;
  }
  if(!aliases.empty()) aliases += ")";
  const std::string hint = spec->type == "bool" ? "[true|false]" : "<" + spec->type + ">";
  return fmt::format("--{} {:<12} {}{}", spec->key, hint, spec->description, aliases);
}

bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) { settings_[spec.key] = value.get<bool>(); return true; }
    if(value.is_number_integer()) { settings_[spec.key] = value.get<int>() != 0; return true; }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) { settings_[spec.key] = value.get<int>(); return true; }
    error = "expected integer";
    return false;
  }
  if(spec.type == "float") {
    if(value.is_number()) { settings_[spec.key] = value.get<double>(); return true; }
    error = "expected number";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) { settings_[spec.key] = value.get<std::string>(); return true; }
    error = "expected string";
    return false;
  }
  if(spec.type == "json") {
    if(spec.default_value.is_object() && !value.is_object()) {
      error = "expected JSON object";
      return false;
    }
    settings_[spec.key] = value;
    return true;
  }
  error = "unknown type '" + spec.type + "'";
  return false;
}

nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  const std::string clean = trim_copy(value);
  try {
    if(spec.type == "bool") {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    if(spec.type == "int") {
      std::size_t used = 0;
      int parsed = std::stoi(clean, &used);
      if(used != clean.size()) error = "trailing characters in integer";
      return parsed;
    }
    if(spec.type == "float") {
      std::size_t used = 0;
      double parsed = std::stod(clean, &used);
      if(used != clean.size()) error = "trailing characters in number";
      return parsed;
    }
    if(spec.type == "string") return clean;
    if(spec.type == "json") return nlohmann::json::parse(clean);
  } catch(const std::exception& e) {
    error = e.what();
    return {};
  }
  error = "unsupported type";
  return {};
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return store(*spec, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

fs::path SettingsManager::default_config_root() {
  const char* home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) : fs::current_path();
  return base / ".dsync";
}

fs::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return default_config_root() / "settings.json";
}

void SettingsManager::set_settings_path(const fs::path& path) {
  settings_path_override_ = path;
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const fs::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const fs::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

std::vector<TeamCredentials> SettingsManager::teams() const {
  std::vector<TeamCredentials> out;
  if(!has("teams") || !settings_.at("teams").is_object()) return out;
  for(const auto& item : settings_.at("teams").items()) {
    TeamCredentials team;
    team.slug = item.key();
    team.api_key = item.value().value("api_key", std::string());
    team.datasets_dir = item.value().value("datasets_dir", std::string());
    out.push_back(std::move(team));
  }
  return out;
}

std::optional<TeamCredentials> SettingsManager::team(const std::string& slug) const {
  for(auto& candidate : teams()) {
    if(candidate.slug == slug) return candidate;
  }
  return std::nullopt;
}

void SettingsManager::store_team(const TeamCredentials& credentials) {
  if(!settings_["teams"].is_object()) settings_["teams"] = nlohmann::json::object();
  settings_["teams"][credentials.slug] = {
    {"api_key", credentials.api_key},
    {"datasets_dir", credentials.datasets_dir.string()}
  };
}
