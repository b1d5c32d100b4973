#include "command_line_parser.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace {

std::vector<std::string> positional_keys_from(const nlohmann::json& argv_spec,
                                              const nlohmann::json& settings_spec) {
  std::vector<std::pair<std::size_t, std::string>> slots;
  for(const auto& row : argv_spec) {
    slots.emplace_back(row.at("index").get<std::size_t>(), row.at("key").get<std::string>());
  }
  std::sort(slots.begin(), slots.end());

  SettingsManager probe(settings_spec);
  std::vector<std::string> keys;
  for(const auto& slot : slots) {
    auto resolved = probe.resolve_key(slot.second);
    if(!resolved) {
      throw std::invalid_argument("positional " + std::to_string(slot.first) +
                                  " names unknown setting '" + slot.second + "'");
    }
    keys.push_back(*resolved);
  }
  return keys;
}

std::string describe_default(const nlohmann::json& row) {
  const auto& value = row.at("default");
  if(value.is_string()) {
    const auto text = value.get<std::string>();
    return text.empty() ? "\"\"" : text;
  }
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    settings_spec_(std::move(settings_spec)),
    positional_keys_(positional_keys_from(argv_spec, settings_spec_)) {}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  static const char* const literals[] = {"true", "false", "on", "off", "yes", "no", "1", "0"};
  const auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return std::any_of(std::begin(literals), std::end(literals),
                     [&](const char* literal){ return lowered == literal; });
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argv) {
    for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  }

  auto store = [&settings](const std::string& key, const std::string& shown, const std::string& value){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw std::invalid_argument("Invalid value for " + shown + ": " + error);
    }
  };

  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    const bool long_form = token.size() > 2 && token.compare(0, 2, "--") == 0;
    const bool short_form = !long_form && token.size() > 1 && token[0] == '-' && token[1] != '-';

    if(long_form || short_form) {
      std::string name = token.substr(long_form ? 2 : 1);
      std::optional<std::string> attached;
      if(long_form) {
        const auto eq = name.find('=');
        if(eq != std::string::npos) {
          attached = name.substr(eq + 1);
          name.resize(eq);
        }
      }

      if(auto key = settings.resolve_key(name)) {
        const std::string shown = (long_form ? "--" : "-") + name;
        std::string value;
        if(attached) {
          value = *attached;
        } else if(settings.is_bool_setting(*key)) {
          value = "true";
          if(i + 1 < args.size() && is_bool_literal(args[i + 1])) value = args[++i];
        } else {
          if(i + 1 >= args.size()) throw std::invalid_argument("Missing value for " + shown);
          value = args[++i];
        }
        store(*key, shown, value);
        continue;
      }
      if(long_form) throw std::invalid_argument("Unknown option --" + name);
      // unknown short tokens such as "-1" are values, not options
    }

    if(next_positional >= positional_keys_.size()) {
      throw std::invalid_argument("Unexpected argument '" + token + "'");
    }
    const auto& key = positional_keys_[next_positional++];
    store(key, key, token);
  }
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - {}", process_name_, summary_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& row : settings_spec_) {
    const auto key = row.at("key").get<std::string>();
    const auto type = row.at("type").get<std::string>();

    std::string names = "--" + key;
    for(const auto& alias : row.value("aliases", std::vector<std::string>{})) {
      names += (alias.size() == 1 ? ", -" : ", --") + alias;
    }
    std::string extra = "default: " + describe_default(row);
    if(row.contains("env")) extra += ", env: " + row.at("env").get<std::string>();
    if(row.contains("min")) extra += ", min: " + row.at("min").dump();

    print_out(nullptr, "  {:<36} {:<8} {} ({})",
              names,
              type == "bool" ? "" : "<" + type + ">",
              row.value("description", ""),
              extra);
  }
  print_out(nullptr, "");
}
