#include "command_line_parser.hpp"
#include "dsync_cli.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <deque>
#include <vector>

using namespace dsync::test;
namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point some_day() {
  std::chrono::system_clock::time_point out;
  if(!parse_iso8601("2023-01-01", out)) throw std::runtime_error("bad fixture date");
  return out;
}

ParsedCommand command(std::vector<std::string> words) {
  ParsedCommand out;
  out.words = std::move(words);
  return out;
}

// A CLI wired to an in-memory service, a scripted prompt and settings kept
// inside a temp directory.
struct CliFixture {
  CliFixture(TestContext& test, const std::string& name)
    : dir(name),
      settings(std::make_shared<SettingsManager>()),
      api(std::make_shared<FakeApiClient>()) {
    settings->set_settings_path(dir / "config/settings.json");
    cli = std::make_unique<DsyncCLI>(settings, test.logger,
      [this](const std::string&, const std::string&) {
        ++factory_calls;
        return std::static_pointer_cast<ApiClient>(api);
      });
    cli->set_prompt([this](const std::string&) -> std::optional<std::string> {
      if(answers.empty()) return std::nullopt;
      auto next = answers.front();
      answers.pop_front();
      return next;
    });
  }

  void login_as_acme() {
    settings->store_team(TeamCredentials{"acme", "good-key", dir / "datasets"});
    std::string error;
    settings->set_from_json("default_team", "acme", error);
  }

  int run(std::vector<std::string> words) { return cli->execute(command(std::move(words))); }

  TempDir dir;
  std::shared_ptr<SettingsManager> settings;
  std::shared_ptr<FakeApiClient> api;
  std::unique_ptr<DsyncCLI> cli;
  std::deque<std::string> answers;
  int factory_calls = 0;
};

bool test_logger_channels(TestContext&) {
  auto logger = std::make_shared<Logger>("unit");
  LogCapture capture;
  capture.attach(logger);
  logger->warn("disk at {}%", 91);
  logger->print("plain {}", "output");
  DSYNC_CHECK(capture.contains("unit:warn: disk at 91%"));
  DSYNC_CHECK(capture.contains("unit:print: plain output"));
  DSYNC_CHECK(channel_level(LogChannel::PrintErr) == spdlog::level::err);
  DSYNC_CHECK(std::string(channel_name(LogChannel::PrintErr)) == "print_err");

  capture.detach_all();
  capture.clear();
  logger->error("after detach");
  DSYNC_CHECK(capture.snapshot().empty());
  return true;
}

bool test_settings_defaults_and_parsing(TestContext&) {
  SettingsManager settings;
  DSYNC_CHECK(settings.get<int>("max_workers") == 4);
  DSYNC_CHECK(settings.get<double>("fps") == 1.0);
  DSYNC_CHECK(!settings.get<bool>("verbose"));

  std::string error;
  DSYNC_CHECK(settings.set_from_string("frame_rate", "2.5", error));
  DSYNC_CHECK(settings.get<double>("fps") == 2.5);
  DSYNC_CHECK(settings.set_from_string("v", "on", error));
  DSYNC_CHECK(settings.get<bool>("verbose"));
  DSYNC_CHECK(!settings.set_from_string("max_workers", "4x", error));
  DSYNC_CHECK(!error.empty());
  DSYNC_CHECK(!settings.set_from_string("no_such_key", "1", error));
  DSYNC_CHECK(!settings.set_from_json("teams", "not an object", error));
  return true;
}

bool test_settings_round_trip(TestContext&) {
  TempDir dir("settings_round_trip");
  const auto path = dir / "settings.json";
  {
    SettingsManager settings;
    std::string error;
    DSYNC_CHECK(settings.set_from_json("default_team", "acme", error));
    DSYNC_CHECK(settings.set_from_json("yes", true, error));
    settings.store_team(TeamCredentials{"acme", "k1", "/data/acme"});
    settings.store_team(TeamCredentials{"beta", "k2", "/data/beta"});
    DSYNC_CHECK(settings.save_to_file(path));
  }
  SettingsManager loaded;
  DSYNC_CHECK(loaded.load_from_file(path));
  DSYNC_CHECK(loaded.get<std::string>("default_team") == "acme");
  DSYNC_CHECK(!loaded.get<bool>("yes")); // not persistent
  DSYNC_CHECK(loaded.teams().size() == 2);
  auto beta = loaded.team("beta");
  DSYNC_CHECK(beta && beta->api_key == "k2" && beta->datasets_dir == fs::path("/data/beta"));
  DSYNC_CHECK(!loaded.team("gamma"));

  write_file(path, "{ not json");
  SettingsManager broken;
  DSYNC_CHECK(!broken.load_from_file(path));
  DSYNC_CHECK(broken.get<std::string>("default_team").empty());
  return true;
}

bool test_command_line_parser(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("dsync");
  const char* argv[] = {"dsync", "dataset", "push", "acme/cars", "a.jpg",
                        "--exclude", "x.jpg,y.jpg", "--fps=3", "-y", "-x", "z.jpg",
                        "--", "--odd.jpg"};
  auto parsed = parser.parse(static_cast<int>(std::size(argv)), argv, settings);
  DSYNC_CHECK(parsed.words.size() == 5);
  DSYNC_CHECK(parsed.word(0) == "dataset" && parsed.word(2) == "acme/cars");
  DSYNC_CHECK(parsed.word(4) == "--odd.jpg");
  DSYNC_CHECK(parsed.word(9).empty());
  DSYNC_CHECK(parsed.values("exclude").size() == 3);
  DSYNC_CHECK(settings.get<double>("fps") == 3.0);
  DSYNC_CHECK(settings.get<bool>("yes"));

  const char* flags[] = {"dsync", "dataset", "export", "cars", "--wait", "--name", "nightly", "--verbose", "false"};
  auto exported = parser.parse(static_cast<int>(std::size(flags)), flags, settings);
  DSYNC_CHECK(exported.flag("wait"));
  DSYNC_CHECK(!exported.flag("all"));
  DSYNC_CHECK(exported.value("name") && *exported.value("name") == "nightly");
  DSYNC_CHECK(!settings.get<bool>("verbose"));
  DSYNC_CHECK(exported.words.size() == 3);

  const char* unknown[] = {"dsync", "teams", "--bogus"};
  DSYNC_CHECK(throws_kind(ErrorKind::Usage, [&]{ parser.parse(3, unknown, settings); }));
  const char* dangling[] = {"dsync", "dataset", "export", "cars", "--name"};
  DSYNC_CHECK(throws_kind(ErrorKind::Usage, [&]{ parser.parse(5, dangling, settings); }));
  const char* bad_value[] = {"dsync", "--max_workers", "many"};
  DSYNC_CHECK(throws_kind(ErrorKind::Usage, [&]{ parser.parse(3, bad_value, settings); }));
  return true;
}

bool test_cli_authenticate(TestContext& t) {
  CliFixture f(t, "cli_auth");
  f.answers = {"bad-key"};
  DSYNC_CHECK(f.run({"authenticate"}) == 1);
  DSYNC_CHECK(t.logs.contains("Invalid API key"));
  DSYNC_CHECK(f.settings->teams().empty());

  DSYNC_CHECK(f.run({"authenticate", "good-key", (f.dir / "data").string()}) == 0);
  auto acme = f.settings->team("acme");
  DSYNC_CHECK(acme && acme->api_key == "good-key");
  DSYNC_CHECK(fs::is_directory(f.dir / "data"));
  DSYNC_CHECK(f.settings->get<std::string>("default_team") == "acme");
  DSYNC_CHECK(fs::exists(f.dir / "config/settings.json"));

  t.logs.clear();
  DSYNC_CHECK(f.run({"team"}) == 0);
  DSYNC_CHECK(t.logs.contains("acme"));
  DSYNC_CHECK(f.run({"team", "nobody"}) == 1);
  return true;
}

bool test_cli_requires_team(TestContext& t) {
  CliFixture f(t, "cli_no_team");
  DSYNC_CHECK(f.run({"dataset", "push", "cars"}) == 1);
  DSYNC_CHECK(f.factory_calls == 0);
  DSYNC_CHECK(f.api->calls().empty());
  DSYNC_CHECK(t.logs.contains("dsync authenticate"));
  DSYNC_CHECK(f.run({"dataset", "frobnicate"}) == 1);
  DSYNC_CHECK(f.run({"dataset", "pull"}) == 1);
  return true;
}

bool test_cli_pull_and_local(TestContext& t) {
  CliFixture f(t, "cli_pull");
  f.login_as_acme();
  f.api->add_dataset("acme", "cars", 2);
  auto remote = f.api->get_remote_dataset(DatasetIdentifier::parse("acme/cars")).value();
  f.api->release_files = {{"images/a.jpg", "aaa"}, {"images/b.jpg", "bbb"}};
  f.api->add_release(remote, "v1", some_day(), true);

  DSYNC_CHECK(f.run({"dataset", "pull", "cars"}) == 0);
  DSYNC_CHECK(t.logs.contains("downloaded at"));
  DSYNC_CHECK(read_file(f.dir / "datasets/acme/cars/images/b.jpg") == "bbb");

  t.logs.clear();
  DSYNC_CHECK(f.run({"dataset", "local"}) == 0);
  DSYNC_CHECK(t.logs.contains("acme/cars"));

  t.logs.clear();
  DSYNC_CHECK(f.run({"dataset", "path", "acme/cars"}) == 0);
  DSYNC_CHECK(t.logs.contains((f.dir / "datasets/acme/cars").string()));

  t.logs.clear();
  DSYNC_CHECK(f.run({"dataset", "path", "boats"}) == 1);
  DSYNC_CHECK(t.logs.contains("dsync dataset pull"));
  return true;
}

bool test_cli_release_absence(TestContext& t) {
  CliFixture f(t, "cli_releases");
  f.login_as_acme();
  f.api->add_dataset("acme", "cars");

  DSYNC_CHECK(f.run({"dataset", "releases", "cars"}) == 0);
  DSYNC_CHECK(t.logs.contains("No available releases, export one first."));

  t.logs.clear();
  DSYNC_CHECK(f.run({"dataset", "pull", "cars:v3"}) == 1);
  DSYNC_CHECK(t.logs.contains("dsync dataset releases"));

  t.logs.clear();
  DSYNC_CHECK(f.run({"dataset", "pull", "boats"}) == 1);
  DSYNC_CHECK(t.logs.contains("dsync dataset remote"));
  DSYNC_CHECK(!fs::exists(f.dir / "datasets/acme/boats"));
  return true;
}

bool test_cli_export_and_remove(TestContext& t) {
  CliFixture f(t, "cli_export");
  f.login_as_acme();
  f.api->add_dataset("acme", "cars");

  ParsedCommand exported = command({"dataset", "export", "cars"});
  exported.options["name"] = {"nightly"};
  exported.options["class_ids"] = {"1", "7"};
  DSYNC_CHECK(f.cli->execute(exported) == 0);
  DSYNC_CHECK(t.logs.contains("successfully exported to acme/cars:nightly"));
  DSYNC_CHECK(f.api->releases.size() == 1 && !f.api->releases[0].available);

  exported.options["class_ids"] = {"seven"};
  DSYNC_CHECK(f.cli->execute(exported) == 1);

  f.answers = {"n"};
  DSYNC_CHECK(f.run({"dataset", "remove", "cars"}) == 0);
  DSYNC_CHECK(f.api->count_calls("remove_dataset") == 0);
  f.answers = {"yes"};
  DSYNC_CHECK(f.run({"dataset", "remove", "cars"}) == 0);
  DSYNC_CHECK(f.api->count_calls("remove_dataset") == 1);

  DSYNC_CHECK(f.run({"dataset", "create", "bikes"}) == 0);
  DSYNC_CHECK(f.run({"dataset", "create", "bikes"}) == 1);
  DSYNC_CHECK(t.logs.contains("already taken"));
  return true;
}

bool test_cli_push_partial(TestContext& t) {
  CliFixture f(t, "cli_push");
  f.login_as_acme();
  f.api->add_dataset("acme", "cars");
  write_file(f.dir / "src/a.jpg", "a");
  write_file(f.dir / "src/b.jpg", "b");
  f.api->failing_uploads.insert("a.jpg");

  ParsedCommand pushed = command({"dataset", "push", "cars"});
  pushed.options["source_dir"] = {(f.dir / "src").string()};
  DSYNC_CHECK(f.cli->execute(pushed) == 1);
  DSYNC_CHECK(t.logs.contains("1 uploaded, 1 failed"));

  f.api->failing_uploads.clear();
  DSYNC_CHECK(f.cli->execute(pushed) == 0);

  fs::create_directories(f.dir / "empty");
  pushed.options["source_dir"] = {(f.dir / "empty").string()};
  const auto lookups = f.api->count_calls("get_remote_dataset");
  DSYNC_CHECK(f.cli->execute(pushed) == 1);
  DSYNC_CHECK(t.logs.contains("empty file set"));
  DSYNC_CHECK(f.api->count_calls("get_remote_dataset") == lookups);

  // Nothing to push into a dataset that does not exist either: the empty set wins.
  ParsedCommand missing = command({"dataset", "push", "no-such-dataset"});
  missing.options["source_dir"] = {(f.dir / "empty").string()};
  DSYNC_CHECK(f.cli->execute(missing) == 1);
  DSYNC_CHECK(f.api->count_calls("get_remote_dataset") == lookups);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"logger_channels", test_logger_channels},
    {"settings_defaults_and_parsing", test_settings_defaults_and_parsing},
    {"settings_round_trip", test_settings_round_trip},
    {"command_line_parser", test_command_line_parser},
    {"cli_authenticate", test_cli_authenticate},
    {"cli_requires_team", test_cli_requires_team},
    {"cli_pull_and_local", test_cli_pull_and_local},
    {"cli_release_absence", test_cli_release_absence},
    {"cli_export_and_remove", test_cli_export_and_remove},
    {"cli_push_partial", test_cli_push_partial},
  };
  return run_suite("settings_cli", tests, argc, argv);
}
