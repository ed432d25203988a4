#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "log.hpp"

std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) alias = to_lower(alias);
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("choices")) spec.choices = entry.at("choices").get<std::vector<std::string>>();
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(spec.type == "choice" && spec.choices.empty()) {
      throw std::runtime_error("Choice setting '" + spec.key + "' lists no choices");
    }
    result.push_back(std::move(spec));
  }
  return result;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
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
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::display_value(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  return display_value(settings_.at(key));
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "archdiff.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                        const nlohmann::json& value,
                                        std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto number = value.get<long long>();
    if(spec.min && number < *spec.min) {
      error = "must be at least " + std::to_string(*spec.min);
      return false;
    }
    settings_[spec.key] = number;
    return true;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "choice") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto choice = to_lower(value.get<std::string>());
    if(std::find(spec.choices.begin(), spec.choices.end(), choice) == spec.choices.end()) {
      std::ostringstream allowed;
      for(std::size_t i = 0; i < spec.choices.size(); ++i) {
        if(i > 0) allowed << "|";
        allowed << spec.choices[i];
      }
      error = "expected one of " + allowed.str();
      return false;
    }
    settings_[spec.key] = choice;
    return true;
  }
  error = "unknown type";
  return false;
}

nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      long long number = std::stoll(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters after number";
        return {};
      }
      return number;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "choice") {
    return clean;
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
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
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

std::vector<std::string> SettingsManager::describe() const {
  std::vector<std::string> lines;
  for(const auto& spec : setting_specs_) {
    std::string hint;
    if(spec.type == "bool") {
      hint = "[true|false]";
    } else if(spec.type == "choice") {
      hint = "<";
      for(std::size_t i = 0; i < spec.choices.size(); ++i) {
        if(i > 0) hint += "|";
        hint += spec.choices[i];
      }
      hint += ">";
    } else {
      hint = "<" + spec.type + ">";
    }
    std::ostringstream line;
    line << "  --" << spec.key << " " << hint << "  " << spec.description;
    if(!spec.aliases.empty()) {
      line << " (alias: ";
      for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
        if(i > 0) line << ", ";
        line << "-" << spec.aliases[i];
      }
      line << ")";
    }
    line << " (default: " << display_value(spec.default_value) << ")";
    lines.push_back(line.str());
  }
  return lines;
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

bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}
