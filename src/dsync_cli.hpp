#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "api_client.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_context.hpp"
#include "transfer_pool.hpp"

class DsyncCLI {
public:
  using ApiFactory = std::function<std::shared_ptr<ApiClient>(const std::string& base_url,
                                                              const std::string& api_key)>;
  // Returns nullopt at end of input.
  using Prompt = std::function<std::optional<std::string>(const std::string& prompt)>;

  DsyncCLI(std::shared_ptr<SettingsManager> settings,
           std::shared_ptr<Logger> logger,
           ApiFactory api_factory,
           const CancellationToken* cancel = nullptr);

  void set_prompt(Prompt prompt) { prompt_ = std::move(prompt); }

  // Runs one command; returns the process exit code.
  int execute(const ParsedCommand& command);

  static std::optional<std::string> readline_prompt(const std::string& prompt);

private:
  int dispatch(const ParsedCommand& command);
  int dispatch_dataset(const ParsedCommand& command);

  int authenticate(const ParsedCommand& command);
  int show_or_set_team(const ParsedCommand& command);
  int list_teams();

  int create_dataset(const ParsedCommand& command);
  int list_remote(const ParsedCommand& command);
  int list_local();
  int local_path(const ParsedCommand& command);
  int remote_url(const ParsedCommand& command);
  int report(const ParsedCommand& command);
  int remove_remote(const ParsedCommand& command);
  int list_dataset_releases(const ParsedCommand& command);
  int export_dataset(const ParsedCommand& command);
  int pull_dataset(const ParsedCommand& command);
  int push_dataset(const ParsedCommand& command);

  SyncContext make_context(const std::optional<std::string>& team) const;
  std::string require_argument(const ParsedCommand& command, std::size_t index, const char* what) const;
  bool confirm(const std::string& question) const;
  int report_failure(const Failure& failure) const;

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  ApiFactory api_factory_;
  const CancellationToken* cancel_ = nullptr;
  Prompt prompt_;
};
