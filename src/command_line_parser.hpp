#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Command line front end for a SettingsManager: `--key value`, `--key=value`,
// `-alias value`, a bare flag for bools, then positionals in argv_spec order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "helixd",
                    std::string summary = "local sync coordination daemon",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","socket_path"}}
                    }));

  // Throws std::invalid_argument on unknown options, missing or bad values.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
