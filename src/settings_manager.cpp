#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

#include "log.hpp"
#include "utils.hpp"

namespace {

SettingsManager::Type type_from_name(const std::string& name, const std::string& key) {
  if(name == "bool") return SettingsManager::Type::Bool;
  if(name == "int") return SettingsManager::Type::Int;
  if(name == "string") return SettingsManager::Type::String;
  throw std::invalid_argument("setting '" + key + "' has unknown type '" + name + "'");
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  if(!specification.is_array()) throw std::invalid_argument("settings specification must be an array");
  for(const auto& row : specification) {
    Entry entry;
    entry.key = row.at("key").get<std::string>();
    entry.names.push_back(to_lower(entry.key));
    for(const auto& alias : row.value("aliases", std::vector<std::string>{})) {
      entry.names.push_back(to_lower(alias));
    }
    entry.type = type_from_name(row.at("type").get<std::string>(), entry.key);
    if(row.contains("min")) entry.min = row.at("min").get<int>();
    entry.env = row.value("env", "");
    entry.persistent = row.value("persistent", true);

    std::string error;
    if(!accept(entry, row.at("default"), entry.value, error)) {
      throw std::invalid_argument("default for '" + entry.key + "': " + error);
    }
    entries_.push_back(std::move(entry));
  }
}

const SettingsManager::Entry* SettingsManager::find(const std::string& token) const {
  const std::string lowered = to_lower(token);
  for(const auto& entry : entries_) {
    if(std::find(entry.names.begin(), entry.names.end(), lowered) != entry.names.end()) return &entry;
  }
  return nullptr;
}

SettingsManager::Entry* SettingsManager::find(const std::string& token) {
  return const_cast<Entry*>(static_cast<const SettingsManager*>(this)->find(token));
}

bool SettingsManager::has(const std::string& key) const {
  return find(key) != nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const Entry* entry = find(token)) return entry->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const Entry* entry = find(key);
  return entry && entry->type == Type::Bool;
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  const Entry* entry = find(key);
  if(!entry) return "<unknown>";
  if(entry->value.is_string()) return entry->value.get<std::string>();
  return entry->value.dump();
}

bool SettingsManager::accept(const Entry& entry, const nlohmann::json& in, nlohmann::json& out, std::string& error) {
  switch(entry.type) {
    case Type::Bool:
      if(in.is_boolean()) { out = in; return true; }
      if(in.is_number_integer()) { out = (in.get<int64_t>() != 0); return true; }
      error = "expected boolean";
      return false;
    case Type::Int: {
      if(!in.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      const int64_t v = in.get<int64_t>();
      if(v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        error = "out of range";
        return false;
      }
      if(entry.min && v < *entry.min) {
        error = "must be at least " + std::to_string(*entry.min);
        return false;
      }
      out = static_cast<int>(v);
      return true;
    }
    case Type::String:
      if(in.is_string()) { out = in; return true; }
      error = "expected string";
      return false;
  }
  error = "unknown type";
  return false;
}

bool SettingsManager::parse_text(const Entry& entry, const std::string& text, nlohmann::json& out, std::string& error) {
  const std::string clean = trim_copy(text);
  switch(entry.type) {
    case Type::Bool: {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return accept(entry, true, out, error);
      if(v == "false" || v == "0" || v == "off" || v == "no") return accept(entry, false, out, error);
      error = "expected boolean (true|false|on|off)";
      return false;
    }
    case Type::Int: {
      std::size_t used = 0;
      long long v = 0;
      try {
        v = std::stoll(clean, &used);
      } catch(const std::exception&) {
        used = 0;
      }
      if(clean.empty() || used != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      return accept(entry, static_cast<int64_t>(v), out, error);
    }
    case Type::String:
      return accept(entry, clean, out, error);
  }
  error = "unknown type";
  return false;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  Entry* entry = find(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  nlohmann::json parsed;
  if(!parse_text(*entry, value, parsed, error)) return false;
  entry->value = std::move(parsed);
  return true;
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  Entry* entry = find(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  nlohmann::json accepted;
  if(!accept(*entry, value, accepted, error)) return false;
  entry->value = std::move(accepted);
  return true;
}

std::size_t SettingsManager::apply_environment() {
  std::size_t applied = 0;
  for(auto& entry : entries_) {
    if(entry.env.empty()) continue;
    const char* raw = std::getenv(entry.env.c_str());
    if(!raw || !*raw) continue;
    std::string error;
    nlohmann::json parsed;
    if(!parse_text(entry, raw, parsed, error)) {
      print_err(nullptr, "Ignoring {}: {}", entry.env, error);
      continue;
    }
    entry.value = std::move(parsed);
    ++applied;
  }
  return applied;
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  if(has("config")) {
    const auto configured = get<std::string>("config");
    if(!configured.empty()) return expand_tilde(configured);
  }
  return expand_tilde(DEFAULT_SETTINGS_PATH);
}

// False when the file is missing or not a JSON object. Unknown keys are
// skipped and bad values keep their previous value.
bool SettingsManager::load() {
  const auto path = settings_path();
  std::ifstream in(path);
  if(!in) return false;

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    print_err(nullptr, "Failed to parse {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    Entry* entry = find(item.key());
    if(!entry) continue;
    std::string error;
    nlohmann::json accepted;
    if(!accept(*entry, item.value(), accepted, error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
      continue;
    }
    entry->value = std::move(accepted);
  }
  return true;
}

bool SettingsManager::save() const {
  const auto path = settings_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
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
  for(const auto& entry : entries_) {
    if(persistent_only && !entry.persistent) continue;
    doc[entry.key] = entry.value;
  }
  return doc;
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
