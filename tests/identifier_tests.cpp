#include "dataset_identifier.hpp"
#include "errors.hpp"
#include "test_runner_utils.hpp"

#include <vector>

using namespace dsync::test;

namespace {

bool test_parse_full_reference(TestContext&) {
  auto id = DatasetIdentifier::parse("team/dataset:v1");
  DSYNC_CHECK(id.team_slug && *id.team_slug == "team");
  DSYNC_CHECK(id.dataset_slug == "dataset");
  DSYNC_CHECK(id.version && *id.version == "v1");
  return true;
}

bool test_parse_dataset_only(TestContext&) {
  auto id = DatasetIdentifier::parse("dataset");
  DSYNC_CHECK(!id.team_slug);
  DSYNC_CHECK(id.dataset_slug == "dataset");
  DSYNC_CHECK(!id.version);

  auto versioned = DatasetIdentifier::parse("dataset:release_2");
  DSYNC_CHECK(!versioned.team_slug);
  DSYNC_CHECK(versioned.version && *versioned.version == "release_2");
  return true;
}

bool test_round_trip(TestContext&) {
  const std::vector<DatasetIdentifier> ids = {
    {std::nullopt, "cars", std::nullopt},
    {std::string("acme"), "cars", std::nullopt},
    {std::string("acme"), "cars", std::string("v-12")},
    {std::nullopt, "cars", std::string("latest")},
    {std::string("we/ird"), "a:b\\c", std::string("x_1")},
  };
  for(const auto& id : ids) {
    DSYNC_CHECK(DatasetIdentifier::parse(render(id)) == id);
  }
  DSYNC_CHECK(render(ids[2]) == "acme/cars:v-12");
  DSYNC_CHECK(ids[2].str() == "acme/cars:v-12");
  return true;
}

bool test_malformed_references(TestContext&) {
  const std::vector<std::string> bad = {
    "", "a/b/c", "/cars", "acme/", "acme/cars:", "cars:v1:v2", "cars:v1/x", "cars:bad name", "cars\\"
  };
  for(const auto& reference : bad) {
    DSYNC_CHECK(throws_kind(ErrorKind::MalformedReference, [&]{ DatasetIdentifier::parse(reference); }));
  }
  return true;
}

bool test_with_team(TestContext&) {
  auto bare = DatasetIdentifier::parse("cars:v1");
  auto filled = with_team(bare, "acme");
  DSYNC_CHECK(filled.team_slug && *filled.team_slug == "acme");
  DSYNC_CHECK(filled.version == bare.version);

  auto explicit_team = with_team(DatasetIdentifier::parse("other/cars"), "acme");
  DSYNC_CHECK(*explicit_team.team_slug == "other");

  DSYNC_CHECK(throws_kind(ErrorKind::MissingConfig, [&]{ with_team(bare, ""); }));
  return true;
}

bool test_release_names(TestContext&) {
  DSYNC_CHECK(is_valid_release_name("v1"));
  DSYNC_CHECK(is_valid_release_name("my-export_2"));
  DSYNC_CHECK(!is_valid_release_name(""));
  DSYNC_CHECK(!is_valid_release_name("v1.0"));
  DSYNC_CHECK(!is_valid_release_name("a/b"));
  return true;
}

bool test_path_safe_slugs(TestContext&) {
  DSYNC_CHECK(is_path_safe_slug("cars"));
  DSYNC_CHECK(is_path_safe_slug("v1.2"));
  DSYNC_CHECK(is_path_safe_slug("..."));
  DSYNC_CHECK(!is_path_safe_slug(""));
  DSYNC_CHECK(!is_path_safe_slug("."));
  DSYNC_CHECK(!is_path_safe_slug(".."));
  DSYNC_CHECK(!is_path_safe_slug("a/b"));
  DSYNC_CHECK(!is_path_safe_slug("a\\b"));
  // Escapes make such slugs parseable; they are refused where they become paths.
  DSYNC_CHECK(!is_path_safe_slug(DatasetIdentifier::parse("acme/a\\/b").dataset_slug));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"parse_full_reference", test_parse_full_reference},
    {"parse_dataset_only", test_parse_dataset_only},
    {"round_trip", test_round_trip},
    {"malformed_references", test_malformed_references},
    {"with_team", test_with_team},
    {"release_names", test_release_names},
    {"path_safe_slugs", test_path_safe_slugs},
  };
  return run_suite("identifier", tests, argc, argv);
}
