#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "settings_manager.hpp"

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Maps argv onto a SettingsManager: "--key value", "-alias value", bare
// booleans ("--dry_run"), and positionals in argv_spec order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "archdiff",
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","folder"}},
                      {{"index",1},{"key","archive"}},
                      {{"index",2},{"key","output"}}
                    }));

  // Throws UsageError describing the first offending argument.
  void parse(int argc, const char* const argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<ArgvSpec> positional_specs_;
};
