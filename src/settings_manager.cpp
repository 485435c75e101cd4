#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

bool SettingsManager::is_explicit(const std::string& key) const {
  return std::find(explicit_keys_.begin(), explicit_keys_.end(), key) != explicit_keys_.end();
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool SettingsManager::load_from_file(const std::filesystem::path& path, std::string& error) {
  std::ifstream in(path);
  if(!in) {
    error = "cannot read " + path.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    error = "failed to parse " + path.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object()) {
    error = path.string() + " must hold a JSON object";
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      error = "unknown setting '" + item.key() + "' in " + path.string();
      return false;
    }
    if(!convert_and_store(*spec, item.value(), error)) {
      error = "invalid value for '" + item.key() + "' in " + path.string() + ": " + error;
      return false;
    }
  }
  return true;
}

bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                        const nlohmann::json& value,
                                        std::string& error) {
  nlohmann::json stored;
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      stored = value.get<bool>();
    } else if(value.is_number_integer()) {
      stored = (value.get<int>() != 0);
    } else {
      error = "expected boolean";
      return false;
    }
  } else if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    stored = value.get<int>();
  } else if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    stored = value.get<std::string>();
  } else if(spec.type == "list") {
    if(value.is_string()) {
      stored = nlohmann::json::array({value.get<std::string>()});
    } else if(value.is_array() &&
              std::all_of(value.begin(), value.end(), [](const nlohmann::json& v){ return v.is_string(); })) {
      stored = value;
    } else {
      error = "expected a list of strings";
      return false;
    }
  } else {
    error = "unknown type";
    return false;
  }
  settings_[spec.key] = std::move(stored);
  if(!is_explicit(spec.key)) explicit_keys_.push_back(spec.key);
  return true;
}

nlohmann::json SettingsManager::parse_string_value(const std::string& type,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(type == "int") {
    try {
      std::size_t used = 0;
      int parsed = std::stoi(clean, &used);
      if(used != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception&) {
      error = "expected integer";
      return {};
    }
  }
  if(type == "string" || type == "list") {
    // list items keep their spacing; paths may contain blanks
    return type == "list" ? value : clean;
  }
  error = "unsupported type";
  return {};
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(spec->type, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

bool SettingsManager::append_from_string(const std::string& key,
                                         const std::string& value,
                                         std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  if(spec->type != "list") {
    return set_from_string(key, value, error);
  }
  nlohmann::json current = is_explicit(spec->key) ? settings_.at(spec->key) : nlohmann::json::array();
  current.push_back(value);
  return convert_and_store(*spec, current, error);
}

bool SettingsManager::set_from_json(const std::string& key,
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

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

bool SettingsManager::is_list_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "list";
}
