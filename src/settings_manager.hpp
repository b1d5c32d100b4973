#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const char* const DEFAULT_SOCKET_PATH = "~/.helix/run/helixd.sock";
inline const char* const DEFAULT_SETTINGS_PATH = "~/.helix/config/helixd.json";

// Daemon settings. Precedence: command line > environment > settings file > defaults.
// Optional fields: "aliases", "env" (variable read by apply_environment), "min" (ints).
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","socket_path"},       {"aliases", {"socket","s"}},  {"type","string"}, {"default",DEFAULT_SOCKET_PATH}, {"env","HELIXD_SOCKET"}, {"description","Unix socket the daemon listens on"}, {"persistent", true}},
  {{"key","io_threads"},        {"aliases", {"threads","t"}}, {"type","int"},    {"default",2},     {"min",1}, {"description","Threads serving connections"}, {"persistent", true}},
  {{"key","sync_workers"},      {"aliases", {"workers","w"}}, {"type","int"},    {"default",4},     {"min",1}, {"description","Threads running sync jobs"}, {"persistent", true}},
  {{"key","shutdown_grace_ms"}, {"aliases", {"grace"}},       {"type","int"},    {"default",250},   {"min",0}, {"description","Milliseconds to let replies drain after shutdown"}, {"persistent", true}},
  {{"key","log_file"},          {"aliases", {"log"}},         {"type","string"}, {"default",""},    {"env","HELIXD_LOG_FILE"}, {"description","Also append log output to this file"}, {"persistent", true}},
  {{"key","verbose"},           {"aliases", {"v"}},           {"type","bool"},   {"default",false}, {"env","HELIXD_VERBOSE"}, {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","config"},            {"aliases", {"c"}},           {"type","string"}, {"default",DEFAULT_SETTINGS_PATH}, {"env","HELIXD_CONFIG"}, {"description","Settings file to load and save"}, {"persistent", false}},
  {{"key","help"},              {"aliases", {"h","?"}},       {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},              {"aliases", {"persist"}},     {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

// helixctl settings; `command` and `argument` come from positionals.
inline const nlohmann::json CTL_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},     {"type","string"}, {"default",""}, {"description","ping | status | enqueue | sync | wait | shutdown"}, {"persistent", false}},
  {{"key","argument"},    {"type","string"}, {"default",""}, {"description","Directory for enqueue/sync, sync id for wait, reason for shutdown"}, {"persistent", false}},
  {{"key","socket_path"}, {"aliases", {"socket","s"}}, {"type","string"}, {"default",DEFAULT_SOCKET_PATH}, {"env","HELIXD_SOCKET"}, {"description","Daemon socket"}, {"persistent", false}},
  {{"key","tool"},        {"aliases", {"t"}},          {"type","string"}, {"default","helixctl"}, {"description","Tool name sent with requests"}, {"persistent", false}},
  {{"key","repo_root"},   {"aliases", {"repo","r"}},   {"type","string"}, {"default",""}, {"description","Repository root (default: current directory)"}, {"persistent", false}},
  {{"key","force"},       {"aliases", {"f"}},          {"type","bool"},   {"default",false}, {"description","Start a new sync even if one is active"}, {"persistent", false}},
  {{"key","timeout_ms"},  {"aliases", {"timeout"}},    {"type","int"},    {"default",30000}, {"min",0}, {"description","WaitSync timeout in milliseconds"}, {"persistent", false}},
  {{"key","help"},        {"aliases", {"h","?"}},      {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}}
});

// Typed key/value settings described by a JSON specification table. Keys and
// aliases are matched case-insensitively.
class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  SettingsManager();
  // Throws std::invalid_argument when the specification itself is malformed.
  explicit SettingsManager(const nlohmann::json& specification);

  // Throws std::runtime_error for an unknown key.
  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  // Both return false and describe the problem in `error` when the value
  // does not fit the setting; the stored value is then unchanged.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Reads every "env" variable named in the specification. Returns how many applied.
  std::size_t apply_environment();

  bool load();
  bool save() const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct Entry {
    std::string key;
    std::vector<std::string> names;   // lowered key, then lowered aliases
    Type type = Type::String;
    nlohmann::json value;
    std::optional<int> min;
    std::string env;
    bool persistent = true;
  };

  const Entry* find(const std::string& token) const;
  Entry* find(const std::string& token);

  static bool accept(const Entry& entry, const nlohmann::json& in, nlohmann::json& out, std::string& error);
  static bool parse_text(const Entry& entry, const std::string& text, nlohmann::json& out, std::string& error);

  std::vector<Entry> entries_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
T SettingsManager::get(const std::string& key) const {
  const Entry* entry = find(key);
  if(!entry) throw std::runtime_error("Unknown setting: " + key);
  return entry->value.get<T>();
}
