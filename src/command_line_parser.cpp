#include "command_line_parser.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#include <spdlog/fmt/fmt.h>

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?')) {
    return true;
  }
  return false;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

// --config is applied first so the command line can override it.
void CommandLineParser::load_config_file(const std::vector<std::string>& args, SettingsManager& settings) {
  std::string path;
  for(std::size_t i = 0; i < args.size(); ++i) {
    std::string token = args[i];
    std::string inline_value;
    bool has_inline = false;
    if(token.rfind("--", 0) == 0) {
      token = token.substr(2);
    } else if(token.size() > 1 && token[0] == '-') {
      token = token.substr(1);
    } else {
      continue;
    }
    auto eq = token.find('=');
    if(eq != std::string::npos) {
      inline_value = token.substr(eq + 1);
      token = token.substr(0, eq);
      has_inline = true;
    }
    auto resolved = settings.resolve_key(token);
    if(!resolved || *resolved != "config") continue;
    if(has_inline) {
      path = inline_value;
    } else if(i + 1 < args.size()) {
      path = args[i + 1];
    }
  }
  if(path.empty()) return;
  std::string error;
  if(!settings.load_from_file(path, error)) {
    throw InvalidConfiguration(error);
  }
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  load_config_file(args, settings);

  std::set<std::string> lists_seen;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    std::string key_token;
    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      key_token = token.substr(2);
    } else if(is_option_token(token)) {
      key_token = token.substr(1);
    } else {
      throw InvalidConfiguration("Unexpected argument '" + token + "'");
    }

    std::optional<std::string> inline_value;
    auto eq = key_token.find('=');
    if(eq != std::string::npos) {
      inline_value = key_token.substr(eq + 1);
      key_token = key_token.substr(0, eq);
    }

    auto resolved = settings.resolve_key(key_token);
    if(!resolved) {
      throw InvalidConfiguration("Unknown option " + token);
    }
    const std::string& key = *resolved;
    std::string error;

    if(settings.is_list_setting(key)) {
      // a repeated option on the command line extends, a config file value is replaced
      if(lists_seen.insert(key).second && !settings.set_from_json(key, nlohmann::json::array(), error)) {
        throw InvalidConfiguration("Invalid value for option '" + key_token + "': " + error);
      }
      std::vector<std::string> values;
      if(inline_value) values.push_back(*inline_value);
      while(i + 1 < args.size() && !is_option_token(args[i + 1])) {
        values.push_back(args[++i]);
      }
      if(values.empty()) {
        throw InvalidConfiguration("Option '" + key_token + "' expects at least one value");
      }
      for(const auto& v : values) {
        if(!settings.append_from_string(key, v, error)) {
          throw InvalidConfiguration("Invalid value for option '" + key_token + "': " + error);
        }
      }
      continue;
    }

    std::string value;
    if(inline_value) {
      value = *inline_value;
    } else if(settings.is_bool_setting(key)) {
      if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
         SettingsManager::is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      if(i + 1 >= args.size()) {
        throw InvalidConfiguration("Missing value for option '" + key_token + "'");
      }
      value = args[++i];
    }
    if(!settings.set_from_string(key, value, error)) {
      throw InvalidConfiguration("Invalid value for option '" + key_token + "': " + error);
    }
  }
}

std::string CommandLineParser::usage(const SettingsManager& settings) const {
  std::ostringstream out;
  out << process_name_ << " - temporary upload/share server with a QR code link\n";
  out << "Usage:\n";
  out << "  " << process_name_ << " [options]\n";
  out << "  " << process_name_ << " --share <path> [<path> ...] [options]\n\n";
  out << "Options:\n";
  for(const auto& entry : settings.specification()) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "" : (type == "list" ? "<path>..." : "<" + type + ">");
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    std::string default_str;
    if(type != "bool" && type != "list") {
      const auto& def = entry.at("default");
      default_str = " (default: " + (def.is_string() ? def.get<std::string>() : def.dump()) + ")";
    }
    std::string option = key;
    std::replace(option.begin(), option.end(), '_', '-');
    out << fmt::format("  --{:<16} {:<10} {}{}{}\n",
                       option,
                       argument_hint,
                       entry.value("description", ""),
                       aliases.str(),
                       default_str);
  }
  return out.str();
}
