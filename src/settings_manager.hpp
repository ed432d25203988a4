#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// key, aliases, type, default, description, persistent; optional "min" for
// ints and "choices" for choice settings.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","folder"},               {"aliases", {"f"}},        {"type","string"}, {"default",""},       {"description","Folder to compare against"}, {"persistent", true}},
  {{"key","archive"},              {"aliases", {"a"}},        {"type","string"}, {"default",""},       {"description","ZIP archive to examine"}, {"persistent", false}},
  {{"key","output"},               {"aliases", {"o","out"}},  {"type","string"}, {"default",""},       {"description","Directory for extracted files"}, {"persistent", true}},
  {{"key","chunk_size"},           {"aliases", {"cs"}},       {"type","int"},    {"default",8192},     {"min",1}, {"description","Bytes read per hashing chunk"}, {"persistent", true}},
  {{"key","workers"},              {"aliases", {"w","j"}},    {"type","int"},    {"default",0},        {"min",0}, {"description","Hashing threads (0 = hardware concurrency)"}, {"persistent", true}},
  {{"key","max_pending"},          {"aliases", {"mp"}},       {"type","int"},    {"default",0},        {"min",0}, {"description","Queued hashing tasks (0 = 4 x workers)"}, {"persistent", true}},
  {{"key","on_error"},             {"aliases", {"e"}},        {"type","choice"}, {"default","continue"}, {"choices", {"continue","abort"}}, {"description","Extraction failure policy"}, {"persistent", true}},
  {{"key","dry_run"},              {"aliases", {"n"}},        {"type","bool"},   {"default",false},    {"description","Classify entries without extracting"}, {"persistent", false}},
  {{"key","all_formats"},          {"aliases", {"af"}},       {"type","bool"},   {"default",false},    {"description","Accept any archive format libarchive reads"}, {"persistent", true}},
  {{"key","progress"},             {"aliases", {"p"}},        {"type","bool"},   {"default",true},     {"description","Show a live progress line"}, {"persistent", true}},
  {{"key","progress_interval_ms"}, {"aliases", {"pi"}},       {"type","int"},    {"default",250},      {"min",10}, {"description","Milliseconds between progress updates"}, {"persistent", true}},
  {{"key","json_report"},          {"aliases", {"report"}},   {"type","string"}, {"default",""},       {"description","Also write the result as JSON to this file"}, {"persistent", false}},
  {{"key","log_file"},             {"aliases", {"lf"}},       {"type","string"}, {"default",""},       {"description","Mirror log output into this file"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},        {"type","bool"},   {"default",false},    {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},    {"type","bool"},   {"default",false},    {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},  {"type","bool"},   {"default",false},    {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return settings_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // One usage line per setting: "--key <type>  description (alias: -a) (default: x)".
  std::vector<std::string> describe() const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::optional<long long> min;
    std::vector<std::string> choices;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;
  static std::string display_value(const nlohmann::json& value);

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};
