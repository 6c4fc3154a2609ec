#include "dsync_cli.hpp"

#include <readline/readline.h>

#include <algorithm>
#include <cstdlib>
#include <set>
#include <tuple>

#include "dataset_identifier.hpp"
#include "local_cache.hpp"
#include "release_ledger.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::seconds kExportPollInterval{5};
constexpr std::size_t kExportPollAttempts = 120;

fs::path expand_home(const std::string& raw) {
  if(raw.empty() || raw[0] != '~') return fs::path(raw);
  const char* home = std::getenv("HOME");
  if(!home) return fs::path(raw);
  return fs::path(home) / raw.substr(raw.size() > 1 && raw[1] == '/' ? 2 : 1);
}

std::string format_file_time(fs::file_time_type when) {
  auto system = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    when - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
  return format_utc(system).substr(0, 10);
}

std::string hint_for(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::RemoteDatasetNotFound:
      return "Use 'dsync dataset remote' to list all the remote datasets.";
    case ErrorKind::ReleaseNotFound:
      return "Use 'dsync dataset releases' to list all available versions.";
    case ErrorKind::DatasetNotFoundLocally:
      return "Use 'dsync dataset remote' to see all the available datasets, and 'dsync dataset pull' to pull them.";
    case ErrorKind::Unauthenticated:
    case ErrorKind::InvalidLogin:
      return "Please re-authenticate with 'dsync authenticate'.";
    case ErrorKind::MissingConfig:
      return "Authenticate first with 'dsync authenticate'.";
    case ErrorKind::ReleaseUnavailable:
      return "The export is still being generated; try again later.";
    case ErrorKind::Usage:
      return "Run 'dsync help' for usage.";
    default:
      return std::string();
  }
}

} // namespace

DsyncCLI::DsyncCLI(std::shared_ptr<SettingsManager> settings,
                   std::shared_ptr<Logger> logger,
                   ApiFactory api_factory,
                   const CancellationToken* cancel)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("cli")),
    api_factory_(std::move(api_factory)),
    cancel_(cancel),
    prompt_(&DsyncCLI::readline_prompt) {}

std::optional<std::string> DsyncCLI::readline_prompt(const std::string& prompt) {
  char* line = readline(prompt.c_str());
  if(!line) return std::nullopt;
  std::string result(line);
  std::free(line);
  return result;
}

int DsyncCLI::execute(const ParsedCommand& command) {
  try {
    return dispatch(command);
  } catch(const SyncError& e) {
    return report_failure(e.failure());
  }
}

int DsyncCLI::report_failure(const Failure& failure) const {
  logger_->print_err("Error: {}", describe(failure));
  auto hint = hint_for(failure.kind);
  if(!hint.empty()) logger_->print_err("{}", hint);
  return 1;
}

std::string DsyncCLI::require_argument(const ParsedCommand& command, std::size_t index, const char* what) const {
  auto value = command.word(index);
  if(value.empty()) {
    throw SyncError(ErrorKind::Usage, command.word(0) + " " + command.word(1), std::string("missing ") + what);
  }
  return value;
}

bool DsyncCLI::confirm(const std::string& question) const {
  if(settings_->get<bool>("yes")) return true;
  auto answer = prompt_(question + " [y/N] ");
  if(!answer) return false;
  auto lowered = to_lower(trim_copy(*answer));
  return lowered == "y" || lowered == "yes";
}

SyncContext DsyncCLI::make_context(const std::optional<std::string>& team) const {
  const std::string slug = team.value_or(settings_->get<std::string>("default_team"));
  if(slug.empty()) {
    throw SyncError(ErrorKind::MissingConfig, "default_team", "no team configured");
  }
  auto credentials = settings_->team(slug);
  if(!credentials || credentials->api_key.empty()) {
    throw SyncError(ErrorKind::MissingConfig, slug, "no API key stored for this team");
  }
  SyncContext ctx;
  ctx.active_team = slug;
  ctx.datasets_root = credentials->datasets_dir.empty()
    ? SettingsManager::default_config_root() / "datasets"
    : expand_home(credentials->datasets_dir.string());
  ctx.api = api_factory_(settings_->get<std::string>("api_url"), credentials->api_key);
  ctx.logger = logger_;
  ctx.max_workers = static_cast<std::size_t>(std::max(1, settings_->get<int>("max_workers")));
  ctx.cancel = cancel_;
  auto logger = logger_;
  ctx.progress = [logger](std::size_t finished, std::size_t total){
    logger->info("{}/{} transfers finished", finished, total);
  };
  return ctx;
}

int DsyncCLI::dispatch(const ParsedCommand& command) {
  const auto cmd = command.word(0);
  if(cmd.empty() || cmd == "help") {
    CommandLineParser().usage(*settings_);
    return cmd.empty() ? 1 : 0;
  }
  if(cmd == "authenticate") return authenticate(command);
  if(cmd == "team") return show_or_set_team(command);
  if(cmd == "teams") return list_teams();
  if(cmd == "dataset") return dispatch_dataset(command);
  throw SyncError(ErrorKind::Usage, cmd, "unknown command");
}

int DsyncCLI::dispatch_dataset(const ParsedCommand& command) {
  const auto sub = command.word(1);
  if(sub == "create") return create_dataset(command);
  if(sub == "remote") return list_remote(command);
  if(sub == "local") return list_local();
  if(sub == "path") return local_path(command);
  if(sub == "url") return remote_url(command);
  if(sub == "report") return report(command);
  if(sub == "remove") return remove_remote(command);
  if(sub == "releases") return list_dataset_releases(command);
  if(sub == "export") return export_dataset(command);
  if(sub == "pull") return pull_dataset(command);
  if(sub == "push") return push_dataset(command);
  throw SyncError(ErrorKind::Usage, "dataset " + sub, "unknown dataset command");
}

int DsyncCLI::authenticate(const ParsedCommand& command) {
  std::string api_key = command.word(1);
  if(api_key.empty()) {
    auto entered = prompt_("API key: ");
    if(!entered || trim_copy(*entered).empty()) {
      throw SyncError(ErrorKind::Usage, "authenticate", "an API key is required");
    }
    api_key = trim_copy(*entered);
  }
  const auto base_url = settings_->get<std::string>("api_url");
  auto api = api_factory_(base_url, api_key);
  const auto team = api->authenticate(api_key);

  std::string datasets_dir = command.word(2);
  if(datasets_dir.empty()) {
    const auto fallback = (SettingsManager::default_config_root() / "datasets").string();
    auto entered = settings_->get<bool>("yes") ? std::optional<std::string>() : prompt_("Datasets directory [" + fallback + "]: ");
    datasets_dir = entered && !trim_copy(*entered).empty() ? trim_copy(*entered) : fallback;
  }
  const auto datasets_path = expand_home(datasets_dir);
  std::error_code ec;
  fs::create_directories(datasets_path, ec);
  if(ec) {
    throw SyncError(ErrorKind::Io, datasets_path.string(), ec.message());
  }

  settings_->store_team(TeamCredentials{team, api_key, datasets_path});
  const bool no_default = settings_->get<std::string>("default_team").empty();
  if(no_default || confirm("Make " + team + " the default team?")) {
    std::string error;
    if(!settings_->set_from_json("default_team", team, error)) {
      throw SyncError(ErrorKind::Io, "default_team", error);
    }
  }
  if(!settings_->save()) {
    throw SyncError(ErrorKind::Io, settings_->settings_path().string(), "unable to save settings");
  }
  logger_->print("Authenticated as team '{}'. Datasets will be stored in {}", team, datasets_path.string());
  return 0;
}

int DsyncCLI::show_or_set_team(const ParsedCommand& command) {
  const auto slug = command.word(1);
  if(slug.empty()) {
    const auto current = settings_->get<std::string>("default_team");
    if(current.empty()) {
      throw SyncError(ErrorKind::MissingConfig, "default_team", "no team configured");
    }
    logger_->print("{}", current);
    return 0;
  }
  if(!settings_->team(slug)) {
    throw SyncError(ErrorKind::MissingConfig, slug, "team is not authenticated");
  }
  std::string error;
  if(!settings_->set_from_json("default_team", slug, error)) {
    throw SyncError(ErrorKind::Io, "default_team", error);
  }
  if(!settings_->save()) {
    throw SyncError(ErrorKind::Io, settings_->settings_path().string(), "unable to save settings");
  }
  logger_->print("Switched to team '{}'", slug);
  return 0;
}

int DsyncCLI::list_teams() {
  const auto current = settings_->get<std::string>("default_team");
  auto teams = settings_->teams();
  if(teams.empty()) {
    logger_->print("No teams configured.");
    return 0;
  }
  for(const auto& team : teams) {
    if(team.slug == current) {
      logger_->print("{} (default)", team.slug);
    } else {
      logger_->print("{}", team.slug);
    }
  }
  return 0;
}

int DsyncCLI::create_dataset(const ParsedCommand& command) {
  const auto name = require_argument(command, 2, "dataset name");
  auto ctx = make_context(std::nullopt);
  try {
    auto dataset = ctx.api->create_dataset(ctx.active_team, name);
    logger_->print("Dataset '{}' ({}) has been created.", dataset.name, render(dataset.identifier()));
    logger_->print("Access at {}", ctx.api->dataset_url(dataset));
  } catch(const SyncError& e) {
    if(e.kind() == ErrorKind::NameTaken) {
      throw SyncError(ErrorKind::NameTaken, ctx.active_team + "/" + name, "dataset name is already taken");
    }
    if(e.kind() == ErrorKind::ValidationError) {
      throw SyncError(ErrorKind::ValidationError, ctx.active_team + "/" + name, "dataset name is not valid");
    }
    throw;
  }
  return 0;
}

int DsyncCLI::list_remote(const ParsedCommand& command) {
  std::vector<RemoteDataset> datasets;
  if(command.flag("all")) {
    for(const auto& team : settings_->teams()) {
      auto ctx = make_context(team.slug);
      auto part = ctx.api->list_remote_datasets(team.slug);
      datasets.insert(datasets.end(), part.begin(), part.end());
    }
  } else {
    auto ctx = make_context(std::nullopt);
    datasets = ctx.api->list_remote_datasets(ctx.active_team);
  }
  if(datasets.empty()) {
    logger_->print("No dataset available.");
    return 0;
  }
  logger_->print("{:<40} {:>10} {:>10}", "name", "images", "progress");
  for(const auto& ds : datasets) {
    logger_->print("{:<40} {:>10} {:>9.1f}%", render(ds.identifier()), ds.image_count, ds.progress * 100.0);
  }
  return 0;
}

int DsyncCLI::list_local() {
  auto ctx = make_context(std::nullopt);
  auto range = list_local_datasets(ctx.datasets_root);
  std::vector<LocalDataset> datasets(range.begin(), range.end());
  std::sort(datasets.begin(), datasets.end(), [](const LocalDataset& a, const LocalDataset& b){
    return std::tie(a.team_slug, a.dataset_slug) < std::tie(b.team_slug, b.dataset_slug);
  });
  if(datasets.empty()) {
    logger_->print("No datasets in {}", ctx.datasets_root.string());
    return 0;
  }
  logger_->print("{:<40} {:>8} {:>12} {:>10}", "name", "images", "sync_date", "size");
  for(const auto& ds : datasets) {
    auto stats = dataset_stats(ds);
    logger_->print("{:<40} {:>8} {:>12} {:>10}",
                   render(ds.identifier()),
                   stats.image_count,
                   format_file_time(stats.last_write),
                   human_size(stats.size.total_bytes));
  }
  return 0;
}

int DsyncCLI::local_path(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  auto ctx = make_context(id.team_slug);
  auto found = locate(ctx.datasets_root, ctx.resolve(id));
  if(!found) return report_failure(found.failure());
  logger_->print("{}", found.value().root_path.string());
  return 0;
}

int DsyncCLI::remote_url(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  auto ctx = make_context(id.team_slug);
  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());
  logger_->print("{}", ctx.api->dataset_url(remote.value()));
  return 0;
}

int DsyncCLI::report(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  const auto granularity = command.value("granularity").value_or(
    command.word(3).empty() ? std::string("day") : command.word(3));
  auto ctx = make_context(id.team_slug);
  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());
  logger_->print("{}", ctx.api->dataset_report(remote.value(), granularity));
  return 0;
}

int DsyncCLI::remove_remote(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  auto ctx = make_context(id.team_slug);
  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());
  logger_->print("About to archive {} on the remote service.", render(remote.value().identifier()));
  if(!confirm("Continue?")) {
    logger_->print("Cancelled.");
    return 0;
  }
  ctx.api->remove_dataset(remote.value());
  logger_->print("Dataset {} archived.", render(remote.value().identifier()));
  return 0;
}

int DsyncCLI::list_dataset_releases(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  auto ctx = make_context(id.team_slug);
  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());

  auto releases = available_releases(list_releases(*ctx.api, remote.value()));
  if(releases.empty()) {
    logger_->print("No available releases, export one first.");
    return 0;
  }
  sort_by_export_date(releases);
  logger_->print("{:<48} {:>8} {:>8} {:>22}", "name", "images", "classes", "export_date");
  for(const auto& release : releases) {
    logger_->print("{:<48} {:>8} {:>8} {:>22}",
                   render(release.identifier), release.image_count, release.class_count,
                   format_utc(release.export_date));
  }
  return 0;
}

int DsyncCLI::export_dataset(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  auto ctx = make_context(id.team_slug);
  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());

  std::vector<int64_t> class_ids;
  for(const auto& raw : command.values("class_ids")) {
    try {
      std::size_t used = 0;
      class_ids.push_back(std::stoll(raw, &used));
      if(used != raw.size()) throw std::invalid_argument(raw);
    } catch(const std::exception&) {
      throw SyncError(ErrorKind::Usage, raw, "class ids must be integers");
    }
  }
  std::optional<std::string> name = command.value("name");
  if(!name && id.version) name = id.version;

  auto pending = create_release(*ctx.api, remote.value(), class_ids, name);
  logger_->print("Dataset {} successfully exported to {}", render(remote.value().identifier()), render(pending.identifier));
  if(!command.flag("wait")) return 0;

  logger_->print("Waiting for {} to become available...", render(pending.identifier));
  auto ready = wait_for_release(*ctx.api, remote.value(), pending.name(),
                                kExportPollInterval, kExportPollAttempts, cancel_);
  if(!ready) return report_failure(ready.failure());
  logger_->print("Release {} is available ({} images)", render(ready.value().identifier), ready.value().image_count);
  return 0;
}

int DsyncCLI::pull_dataset(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  const auto version = id.version.value_or("latest");
  auto ctx = make_context(id.team_slug);
  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());

  auto release = resolve_version(*ctx.api, remote.value(), version);
  if(!release) return report_failure(release.failure());

  auto outcome = pull(ctx, release.value());
  if(!outcome.summary.ok()) {
    for(const auto& failure : outcome.summary.failed) {
      logger_->print_err("  failed: {} ({})", failure.first, failure.second);
    }
    logger_->print_err("Pull of {} incomplete: {} of {} file(s) transferred, {} failed, {} cancelled. Run the pull again to resume.",
                       render(release.value().identifier), outcome.summary.succeeded, outcome.summary.total(),
                       outcome.summary.failed.size(), outcome.summary.cancelled.size());
    return 1;
  }
  logger_->print("Dataset {} downloaded at {}.", render(release.value().identifier), outcome.dataset.root_path.string());
  return 0;
}

int DsyncCLI::push_dataset(const ParsedCommand& command) {
  auto id = DatasetIdentifier::parse(require_argument(command, 2, "dataset reference"));
  auto ctx = make_context(id.team_slug);

  TransferRequest request;
  request.frame_rate = settings_->get<double>("fps");
  if(command.words.size() > 3) {
    std::set<fs::path> files;
    for(std::size_t i = 3; i < command.words.size(); ++i) files.insert(command.words[i]);
    request.files_to_upload = std::move(files);
  }
  auto excluded = command.values("exclude");
  if(!excluded.empty()) {
    request.files_to_exclude = std::set<fs::path>(excluded.begin(), excluded.end());
  }
  if(auto source = command.value("source_dir")) {
    request.source_root = expand_home(*source);
  }

  // Scan once, before the dataset lookup, then hand push the resolved list.
  auto candidates = checked_push_candidates(request, render(ctx.resolve(id)));
  request.files_to_upload = std::set<fs::path>(candidates.begin(), candidates.end());

  auto remote = ctx.api->get_remote_dataset(ctx.resolve(id));
  if(!remote) return report_failure(remote.failure());

  auto summary = push(ctx, remote.value(), request);
  if(!summary.ok()) {
    for(const auto& failure : summary.failed) {
      logger_->print_err("  failed: {} ({})", failure.first, failure.second);
    }
    logger_->print_err("Push to {} finished with problems: {} uploaded, {} failed, {} cancelled.",
                       render(remote.value().identifier()), summary.succeeded,
                       summary.failed.size(), summary.cancelled.size());
    return 1;
  }
  logger_->print("Uploaded {} item(s) to {}.", summary.succeeded, render(remote.value().identifier()));
  return 0;
}
