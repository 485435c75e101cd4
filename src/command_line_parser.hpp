#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager. Accepts --key value, --key=value, -alias,
// bare --flag for booleans, and list options that take every following
// non-option token. Throws InvalidConfiguration on bad input.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "qrdrop");

  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  std::string usage(const SettingsManager& settings) const;

private:
  static bool is_option_token(const std::string& candidate);
  static void load_config_file(const std::vector<std::string>& args, SettingsManager& settings);

  std::string process_name_;
};
