#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","host"},            {"aliases", {"bind"}},          {"type","string"}, {"default","0.0.0.0"},        {"description","Interface/IP to bind"}},
  {{"key","port"},            {"aliases", {"p"}},             {"type","int"},    {"default",0},                {"description","TCP port to listen on (0 = auto)"}},
  {{"key","ttl_minutes"},     {"aliases", {"ttl"}},           {"type","int"},    {"default",15},               {"description","Minutes until the link expires"}},
  {{"key","upload_dir"},      {"aliases", {"dir","d"}},       {"type","string"}, {"default","uploads"},        {"description","Directory to store uploaded files"}},
  {{"key","exit_on_upload"},  {"aliases", {"exit","x"}},      {"type","bool"},   {"default",false},            {"description","Exit after the first completed upload (or download in share mode)"}},
  {{"key","share"},           {"aliases", {"s"}},             {"type","list"},   {"default",nlohmann::json::array()}, {"description","Share one or more files or directories instead of accepting uploads"}},
  {{"key","max_upload_mb"},   {"aliases", {"max_upload"}},    {"type","int"},    {"default",1024},             {"description","Largest accepted upload request, in MiB"}},
  {{"key","workers"},         {"aliases", {"threads"}},       {"type","int"},    {"default",0},                {"description","Worker threads (0 = hardware concurrency)"}},
  {{"key","logo_file"},       {"aliases", {"logo"}},          {"type","string"}, {"default","ascii_logo.txt"}, {"description","ASCII logo shown in the terminal and on the pages"}},
  {{"key","log_file"},        {"aliases", {"log"}},           {"type","string"}, {"default",""},               {"description","Also write log lines to this file"}},
  {{"key","config"},          {"aliases", {"c"}},             {"type","string"}, {"default",""},               {"description","JSON file with setting values"}},
  {{"key","verbose"},         {"aliases", {"v"}},             {"type","bool"},   {"default",false},            {"description","Enable verbose logging"}},
  {{"key","help"},            {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},            {"description","Show command help and exit"}}
});

// Typed view over SETTINGS_SPECIFICATION. Setters report problems through
// the `error` out-parameter; callers decide whether they are fatal.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;
  // True once a value was supplied by a config file or the command line.
  bool is_explicit(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool append_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Merges a JSON object of settings. Returns false with `error` set if the
  // file is unreadable, not an object, or holds an invalid value.
  bool load_from_file(const std::filesystem::path& path, std::string& error);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  bool is_list_setting(const std::string& key) const;
  const nlohmann::json& specification() const { return specification_; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;
  void apply_defaults();

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const std::string& type, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<std::string> explicit_keys_;
  std::vector<SettingSpec> setting_specs_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
