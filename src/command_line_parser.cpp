#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe;
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         (std::isalpha(static_cast<unsigned char>(candidate[1])) || candidate[1] == '?');
}

void CommandLineParser::parse(int argc, const char* const argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      const bool long_form = token.rfind("--", 0) == 0;
      std::string name = token.substr(long_form ? 2 : 1);
      std::string inline_value;
      bool has_inline_value = false;
      if(auto eq = name.find('='); eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
        has_inline_value = true;
      }

      auto resolved = settings.resolve_key(name);
      if(!resolved) {
        throw UsageError("Unknown option " + token);
      }

      std::string value;
      if(has_inline_value) {
        value = inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw UsageError("Missing value for option '" + name + "'");
        }
        value = args[++i];
      }

      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw UsageError("Invalid value for option '" + name + "': " + error);
      }
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw UsageError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw UsageError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - extract the archive entries a folder does not already hold", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& line : settings.describe()) {
    print_out(nullptr, "{}", line);
  }
  print_out(nullptr, "");
}
