#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

const char* const kCommandSummary[][2] = {
  {"authenticate",                 "Store an API key and pick the default team and datasets directory"},
  {"team [slug]",                  "Show the active team, or switch to another configured team"},
  {"teams",                        "List configured teams"},
  {"dataset create <name>",        "Create a remote dataset"},
  {"dataset remote",               "List remote datasets with annotation progress"},
  {"dataset local",                "List datasets pulled into the datasets directory"},
  {"dataset path <ref>",           "Print the local path of a pulled dataset"},
  {"dataset url <ref>",            "Print the web URL of a remote dataset"},
  {"dataset report <ref>",         "Print the annotation report of a dataset"},
  {"dataset remove <ref>",         "Archive a remote dataset"},
  {"dataset releases <ref>",       "List available releases of a dataset"},
  {"dataset export <ref>",         "Start a new release of a dataset"},
  {"dataset pull <ref[:version]>", "Download a release (default: latest) into the datasets directory"},
  {"dataset push <ref> [files]",   "Upload files, or scan --source_dir, into a dataset"},
};

} // namespace

std::optional<std::string> ParsedCommand::value(const std::string& key) const {
  auto it = options.find(key);
  if(it == options.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

std::vector<std::string> ParsedCommand::values(const std::string& key) const {
  auto it = options.find(key);
  if(it == options.end()) return {};
  return it->second;
}

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json command_options)
  : process_name_(std::move(process_name)) {
  for(const auto& entry : command_options) {
    OptionSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) spec.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    spec.type = entry.at("type").get<std::string>();
    spec.description = entry.value("description", "");
    options_.push_back(std::move(spec));
  }
}

const CommandLineParser::OptionSpec* CommandLineParser::find_option(const std::string& token) const {
  const auto lowered = to_lower(token);
  for(const auto& spec : options_) {
    if(spec.key == lowered) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0 && candidate.size() > 2) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  const auto lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

ParsedCommand CommandLineParser::parse(int argc, const char* const argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  ParsedCommand command;
  bool options_done = false;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(options_done || !is_option_token(token)) {
      command.words.push_back(token);
      continue;
    }
    if(token == "--") {
      options_done = true;
      continue;
    }

    std::string key = token.rfind("--", 0) == 0 ? token.substr(2) : token.substr(1);
    std::optional<std::string> inline_value;
    auto eq = key.find('=');
    if(eq != std::string::npos) {
      inline_value = key.substr(eq + 1);
      key = key.substr(0, eq);
    }

    auto next_value = [&](const std::string& name) -> std::string {
      if(inline_value) return *inline_value;
      if(i + 1 >= args.size()) {
        throw SyncError(ErrorKind::Usage, name, "missing value for option");
      }
      return args[++i];
    };

    if(const auto* spec = find_option(key)) {
      auto& slot = command.options[spec->key];
      if(spec->type == "flag") {
        slot.push_back("true");
      } else if(spec->type == "list") {
        for(auto& part : split(next_value(spec->key), ',')) slot.push_back(part);
      } else {
        slot.push_back(next_value(spec->key));
      }
      continue;
    }

    auto resolved = settings.resolve_key(key);
    if(!resolved) {
      throw SyncError(ErrorKind::Usage, token, "unknown option");
    }
    std::string value;
    if(settings.is_bool_setting(*resolved)) {
      if(inline_value) {
        value = *inline_value;
      } else if(i + 1 < args.size() && is_bool_literal(args[i + 1])) {
        value = args[++i];
      } else {
        value = "true";
      }
    } else {
      value = next_value(*resolved);
    }
    std::string error;
    if(!settings.set_from_string(*resolved, value, error)) {
      throw SyncError(ErrorKind::Usage, *resolved, "invalid value '" + value + "': " + error);
    }
  }
  return command;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - dataset synchronization client", process_name_);
  print_out(nullptr, "Usage: {} <command> [arguments] [options]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Commands:");
  for(const auto& entry : kCommandSummary) {
    print_out(nullptr, "  {:<30} {}", entry[0], entry[1]);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Command options:");
  for(const auto& spec : options_) {
    std::string hint = spec.type == "flag" ? "" : (spec.type == "list" ? "<a,b,...>" : "<value>");
    print_out(nullptr, "  --{} {:<12} {}", spec.key, hint, spec.description);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Settings (add --save to persist):");
  for(const auto& key : settings.keys()) {
    if(key == "teams") continue;
    print_out(nullptr, "  {} (current: {})", settings.describe(key), settings.value_as_string(key));
  }
}
