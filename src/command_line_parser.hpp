#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "settings_manager.hpp"

// Options that belong to individual commands rather than to the settings table.
inline const nlohmann::json COMMAND_OPTIONS = nlohmann::json::array({
  {{"key","exclude"},     {"aliases", {"x"}},   {"type","list"},   {"description","File or directory to leave out of the push scan (repeatable)"}},
  {{"key","source_dir"},  {"aliases", {"src"}}, {"type","string"}, {"description","Directory scanned by push when no files are listed"}},
  {{"key","name"},        {"aliases", {"n"}},   {"type","string"}, {"description","Release name for export"}},
  {{"key","class_ids"},   {"aliases", {"c"}},   {"type","list"},   {"description","Annotation class ids kept by export (comma separated)"}},
  {{"key","wait"},        {"aliases", {"w"}},   {"type","flag"},   {"description","Poll until the exported release is available"}},
  {{"key","all"},         {"aliases", {"a"}},   {"type","flag"},   {"description","List datasets of every configured team"}},
  {{"key","granularity"}, {"aliases", {"g"}},   {"type","string"}, {"description","Report granularity (day, week, month, total)"}}
});

struct ParsedCommand {
  std::vector<std::string> words; // command path followed by its arguments
  std::map<std::string, std::vector<std::string>> options;

  bool flag(const std::string& key) const { return options.count(key) > 0; }
  std::optional<std::string> value(const std::string& key) const;
  std::vector<std::string> values(const std::string& key) const;
  std::string word(std::size_t index) const { return index < words.size() ? words[index] : std::string(); }
};

class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "dsync",
                             nlohmann::json command_options = COMMAND_OPTIONS);

  // Settings options are applied to `settings`; everything else lands in the
  // returned command. Throws SyncError(Usage) on malformed input.
  ParsedCommand parse(int argc, const char* const argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct OptionSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    std::string description;
  };

  const OptionSpec* find_option(const std::string& token) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::vector<OptionSpec> options_;
};
