#include "transfer_engine.hpp"
#include "transfer_pool.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace dsync::test;
namespace fs = std::filesystem;

namespace {

std::chrono::system_clock::time_point some_day() {
  std::chrono::system_clock::time_point out;
  if(!parse_iso8601("2023-05-01T12:00:00Z", out)) throw std::runtime_error("bad fixture date");
  return out;
}

// Service that rejects the key on every upload, as after a revocation.
class RevokedKeyApi : public FakeApiClient {
public:
  void upload_item(const RemoteDataset&, const UploadItem& item) override {
    ++attempts;
    throw SyncError(ErrorKind::Unauthenticated, item.source.string(), "401 Unauthorized");
  }

  std::atomic<int> attempts{0};
};

struct Fixture {
  explicit Fixture(TestContext& test, const std::string& name)
    : dir(name), api(std::make_shared<FakeApiClient>()) {
    api->add_dataset("acme", "cars");
    remote = api->get_remote_dataset(DatasetIdentifier::parse("acme/cars")).value();
    ctx.active_team = "acme";
    ctx.datasets_root = dir / "datasets";
    ctx.api = api;
    ctx.logger = test.logger;
    ctx.max_workers = 2;
  }

  Release release(const std::string& name, bool available) {
    api->add_release(remote, name, some_day(), available);
    return api->releases.back();
  }

  TempDir dir;
  std::shared_ptr<FakeApiClient> api;
  RemoteDataset remote;
  SyncContext ctx;
};

bool test_push_empty_set(TestContext& t) {
  Fixture f(t, "push_empty");
  fs::create_directories(f.dir / "empty");
  TransferRequest request;
  request.source_root = f.dir / "empty";
  DSYNC_CHECK(throws_kind(ErrorKind::EmptyFileSet, [&]{ push(f.ctx, f.remote, request); }));
  DSYNC_CHECK(f.api->calls().size() == 1); // only the fixture's lookup
  return true;
}

bool test_push_rejects_bad_frame_rate(TestContext& t) {
  Fixture f(t, "push_fps");
  write_file(f.dir / "src/a.jpg", "a");
  TransferRequest request;
  request.source_root = f.dir / "src";
  request.frame_rate = 0.0;
  DSYNC_CHECK(throws_kind(ErrorKind::ValidationError, [&]{ push(f.ctx, f.remote, request); }));
  request.frame_rate = -2.0;
  DSYNC_CHECK(throws_kind(ErrorKind::ValidationError, [&]{ push(f.ctx, f.remote, request); }));
  DSYNC_CHECK(f.api->count_calls("upload_item") == 0);
  return true;
}

bool test_push_partial_failure(TestContext& t) {
  Fixture f(t, "push_partial");
  write_file(f.dir / "src/a.jpg", "a");
  write_file(f.dir / "src/b.jpg", "b");
  write_file(f.dir / "src/c.png", "c");
  f.api->failing_uploads.insert("b.jpg");

  TransferRequest request;
  request.source_root = f.dir / "src";
  auto summary = push(f.ctx, f.remote, request);
  DSYNC_CHECK(summary.succeeded == 2);
  DSYNC_CHECK(summary.failed.size() == 1);
  DSYNC_CHECK(fs::path(summary.failed[0].first).filename() == "b.jpg");
  DSYNC_CHECK(summary.cancelled.empty());
  DSYNC_CHECK(t.logs.contains("failed"));
  return true;
}

bool test_push_exclusions(TestContext& t) {
  Fixture f(t, "push_exclude");
  write_file(f.dir / "src/keep.jpg", "k");
  write_file(f.dir / "src/skip.jpg", "s");
  write_file(f.dir / "src/raw/one.png", "1");
  write_file(f.dir / "src/raw/two.png", "2");
  write_file(f.dir / "src/notes.txt", "not media");

  TransferRequest request;
  request.source_root = f.dir / "src";
  request.files_to_exclude = std::set<fs::path>{f.dir / "src/skip.jpg", f.dir / "src/raw"};
  auto candidates = collect_push_candidates(request);
  DSYNC_CHECK(candidates.size() == 1);
  DSYNC_CHECK(candidates[0].filename() == "keep.jpg");

  // An explicit list wins over exclusions and is not filtered by extension.
  request.files_to_upload = std::set<fs::path>{f.dir / "src/skip.jpg", f.dir / "src/notes.txt"};
  candidates = collect_push_candidates(request);
  DSYNC_CHECK(candidates.size() == 2);
  return true;
}

bool test_push_stops_on_revoked_key(TestContext& t) {
  Fixture f(t, "push_revoked");
  write_file(f.dir / "src/a.jpg", "a");
  write_file(f.dir / "src/b.jpg", "b");
  write_file(f.dir / "src/c.jpg", "c");
  auto revoked = std::make_shared<RevokedKeyApi>();
  f.ctx.api = revoked;
  f.ctx.max_workers = 1;

  TransferRequest request;
  request.source_root = f.dir / "src";
  DSYNC_CHECK(throws_kind(ErrorKind::Unauthenticated, [&]{ push(f.ctx, f.remote, request); }));
  DSYNC_CHECK(revoked->attempts == 1);
  return true;
}

bool test_push_frame_rate_applies_to_video_only(TestContext& t) {
  Fixture f(t, "push_mixed");
  write_file(f.dir / "src/clip.mp4", mp4(mvhd_v0(600, 1200))); // 2 s
  write_file(f.dir / "src/photo.jpg", std::string("\xFF\xD8\xFF\xE0", 4) + "jfif");

  TransferRequest request;
  request.source_root = f.dir / "src";
  request.frame_rate = 2.0;
  auto summary = push(f.ctx, f.remote, request);
  DSYNC_CHECK(summary.ok());
  DSYNC_CHECK(summary.succeeded == 5);
  DSYNC_CHECK(f.api->uploaded.size() == 5);

  std::set<uint64_t> indices;
  std::set<uint64_t> timestamps;
  std::size_t stills = 0;
  for(const auto& item : f.api->uploaded) {
    if(!item.frame) {
      ++stills;
      DSYNC_CHECK(item.remote_name == "photo.jpg");
      continue;
    }
    DSYNC_CHECK(item.source.filename() == "clip.mp4");
    DSYNC_CHECK(!item.frame->whole_video);
    DSYNC_CHECK(item.frame->fps == 2.0);
    indices.insert(item.frame->index);
    timestamps.insert(item.frame->timestamp_ms);
  }
  DSYNC_CHECK(stills == 1);
  DSYNC_CHECK((indices == std::set<uint64_t>{0, 1, 2, 3}));
  DSYNC_CHECK((timestamps == std::set<uint64_t>{0, 500, 1000, 1500}));
  return true;
}

bool test_pull_unavailable(TestContext& t) {
  Fixture f(t, "pull_unavailable");
  auto pending = f.release("v1", false);
  DSYNC_CHECK(throws_kind(ErrorKind::ReleaseUnavailable, [&]{ pull(f.ctx, pending); }));
  DSYNC_CHECK(!fs::exists(f.ctx.datasets_root));
  DSYNC_CHECK(f.api->count_calls("list_release_files") == 0);
  return true;
}

bool test_pull_is_idempotent(TestContext& t) {
  Fixture f(t, "pull_twice");
  f.api->release_files = {
    {"images/0001.jpg", "first image"},
    {"images/0002.jpg", "second image"},
    {"releases/v1/annotations/0001.json", "{\"boxes\":[]}"},
  };
  auto ready = f.release("v1", true);

  auto first = pull(f.ctx, ready);
  DSYNC_CHECK(first.summary.ok());
  DSYNC_CHECK(first.summary.succeeded == 3);
  DSYNC_CHECK(first.dataset.root_path == f.ctx.datasets_root / "acme" / "cars");
  auto before = snapshot_tree(first.dataset.root_path);
  DSYNC_CHECK(before.count("images/0001.jpg") && before["images/0001.jpg"] == "first image");
  DSYNC_CHECK(before.count(".dsync/release.json") == 1);

  auto second = pull(f.ctx, ready);
  DSYNC_CHECK(second.summary.ok());
  DSYNC_CHECK(snapshot_tree(second.dataset.root_path) == before);
  // Matching checksums mean nothing was fetched again.
  DSYNC_CHECK(f.api->count_calls("download_release_file") == 3);
  return true;
}

bool test_pull_resumes_after_failure(TestContext& t) {
  Fixture f(t, "pull_resume");
  f.api->release_files = {{"images/a.jpg", "aaa"}, {"images/b.jpg", "bbb"}};
  f.api->failing_downloads.insert("images/b.jpg");
  auto ready = f.release("v2", true);

  auto partial = pull(f.ctx, ready);
  DSYNC_CHECK(!partial.summary.ok());
  DSYNC_CHECK(partial.summary.failed.size() == 1);
  DSYNC_CHECK(partial.summary.failed[0].first == "images/b.jpg");
  DSYNC_CHECK(!fs::exists(partial.dataset.root_path / ".dsync/release.json"));
  DSYNC_CHECK(!fs::exists(partial.dataset.root_path / "images/b.jpg"));

  f.api->failing_downloads.clear();
  auto resumed = pull(f.ctx, ready);
  DSYNC_CHECK(resumed.summary.ok());
  DSYNC_CHECK(read_file(resumed.dataset.root_path / "images/b.jpg") == "bbb");
  DSYNC_CHECK(f.api->count_calls("download_release_file images/a.jpg") == 1);
  return true;
}

bool test_pull_rejects_escaping_paths(TestContext& t) {
  Fixture f(t, "pull_escape");
  f.api->release_files = {{"../outside.jpg", "x"}, {"images/ok.jpg", "ok"}};
  auto ready = f.release("v1", true);
  auto outcome = pull(f.ctx, ready);
  DSYNC_CHECK(outcome.summary.succeeded == 1);
  DSYNC_CHECK(outcome.summary.failed.size() == 1);
  DSYNC_CHECK(outcome.summary.failed[0].first == "../outside.jpg");
  DSYNC_CHECK(!fs::exists(f.ctx.datasets_root / "acme" / "outside.jpg"));
  return true;
}

bool test_pull_keeps_unrelated_files_and_repairs_modified(TestContext& t) {
  Fixture f(t, "pull_overlay");
  f.api->release_files = {{"images/0001.jpg", "first image"}, {"images/0002.jpg", "second image"}};
  auto ready = f.release("v1", true);
  const auto root = f.ctx.datasets_root / "acme" / "cars";
  write_file(root / "extra/keep.txt", "my notes");
  write_file(root / "images/0001.jpg", "edited locally");

  auto outcome = pull(f.ctx, ready);
  DSYNC_CHECK(outcome.summary.ok());
  DSYNC_CHECK(read_file(root / "extra/keep.txt") == "my notes");
  DSYNC_CHECK(read_file(root / "images/0001.jpg") == "first image");
  DSYNC_CHECK(read_file(root / "images/0002.jpg") == "second image");
  DSYNC_CHECK(f.api->count_calls("download_release_file") == 2);
  DSYNC_CHECK(!fs::exists(root / "images/0001.jpg.part"));
  return true;
}

bool test_pull_rejects_unsafe_slugs(TestContext& t) {
  Fixture f(t, "pull_slugs");
  f.api->release_files = {{"images/a.jpg", "a"}};
  auto ready = f.release("v1", true);

  auto nested = ready;
  nested.identifier = DatasetIdentifier::parse("acme/a\\/b:v1");
  DSYNC_CHECK(nested.identifier.dataset_slug == "a/b");
  DSYNC_CHECK(throws_kind(ErrorKind::ValidationError, [&]{ pull(f.ctx, nested); }));

  auto climbing = ready;
  climbing.identifier.team_slug = std::string("..");
  DSYNC_CHECK(throws_kind(ErrorKind::ValidationError, [&]{ pull(f.ctx, climbing); }));

  auto dotted = ready;
  dotted.identifier.dataset_slug = ".";
  DSYNC_CHECK(throws_kind(ErrorKind::ValidationError, [&]{ pull(f.ctx, dotted); }));

  DSYNC_CHECK(f.api->count_calls("list_release_files") == 0);
  DSYNC_CHECK(!fs::exists(f.ctx.datasets_root));
  DSYNC_CHECK(throws_kind(ErrorKind::ValidationError, [&]{
    dataset_directory(f.ctx.datasets_root, DatasetIdentifier::parse("../x"));
  }));
  DSYNC_CHECK(dataset_directory(f.ctx.datasets_root, ready.identifier) == f.ctx.datasets_root / "acme" / "cars");
  return true;
}

bool test_pool_isolates_failures(TestContext&) {
  std::atomic<int> ran{0};
  std::vector<TransferTask> tasks;
  for(int i = 0; i < 6; ++i) {
    tasks.push_back(TransferTask{"task" + std::to_string(i), [i, &ran]{
      ++ran;
      if(i % 3 == 0) throw std::runtime_error("boom " + std::to_string(i));
    }});
  }
  std::atomic<std::size_t> last_finished{0};
  auto summary = run_transfer_tasks(tasks, PoolConfig{3, std::chrono::milliseconds(0)}, nullptr,
                                    [&](std::size_t finished, std::size_t){ last_finished = finished; });
  DSYNC_CHECK(ran == 6);
  DSYNC_CHECK(summary.succeeded == 4);
  DSYNC_CHECK(summary.failed.size() == 2);
  DSYNC_CHECK(summary.failed[0].first == "task0" && summary.failed[1].first == "task3");
  DSYNC_CHECK(summary.failed[1].second == "boom 3");
  DSYNC_CHECK(summary.total() == 6);
  return true;
}

bool test_pool_cancellation(TestContext&) {
  CancellationToken cancel;
  std::vector<TransferTask> tasks;
  tasks.push_back(TransferTask{"first", [&cancel]{ cancel.cancel(); }});
  for(int i = 0; i < 4; ++i) {
    tasks.push_back(TransferTask{"later" + std::to_string(i), []{}});
  }
  auto summary = run_transfer_tasks(tasks, PoolConfig{1}, &cancel);
  DSYNC_CHECK(summary.succeeded == 1);
  DSYNC_CHECK(summary.cancelled.size() == 4);
  DSYNC_CHECK(!summary.ok());
  return true;
}

bool test_pool_aborts_on_credential_failure(TestContext&) {
  std::atomic<int> ran{0};
  std::vector<TransferTask> tasks;
  tasks.push_back(TransferTask{"ok", [&ran]{ ++ran; }});
  tasks.push_back(TransferTask{"login", [&ran]{
    ++ran;
    throw SyncError(ErrorKind::InvalidLogin, "", "Invalid API key");
  }});
  for(int i = 0; i < 3; ++i) {
    tasks.push_back(TransferTask{"later" + std::to_string(i), [&ran]{ ++ran; }});
  }
  DSYNC_CHECK(throws_kind(ErrorKind::InvalidLogin, [&]{ run_transfer_tasks(tasks, PoolConfig{1}); }));
  DSYNC_CHECK(ran == 2);

  // Other SyncErrors stay per task.
  tasks[1].run = []{ throw SyncError(ErrorKind::Io, "x", "disk full"); };
  ran = 0;
  auto summary = run_transfer_tasks(tasks, PoolConfig{1});
  DSYNC_CHECK(summary.failed.size() == 1);
  DSYNC_CHECK(summary.succeeded == 4);
  return true;
}

bool test_pool_progress_runs_unlocked(TestContext&) {
  std::mutex mutex;
  std::condition_variable both_inside;
  int inside = 0;
  bool overlapped = false;
  auto progress = [&](std::size_t, std::size_t) {
    std::unique_lock<std::mutex> lock(mutex);
    ++inside;
    both_inside.notify_all();
    if(both_inside.wait_for(lock, std::chrono::seconds(2), [&]{ return inside >= 2; })) overlapped = true;
  };
  std::vector<TransferTask> tasks = {{"a", []{}}, {"b", []{}}};
  auto summary = run_transfer_tasks(tasks, PoolConfig{2, std::chrono::milliseconds(0)}, nullptr, progress);
  DSYNC_CHECK(summary.succeeded == 2);
  DSYNC_CHECK(overlapped);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"push_empty_set", test_push_empty_set},
    {"push_rejects_bad_frame_rate", test_push_rejects_bad_frame_rate},
    {"push_partial_failure", test_push_partial_failure},
    {"push_exclusions", test_push_exclusions},
    {"push_stops_on_revoked_key", test_push_stops_on_revoked_key},
    {"push_frame_rate_applies_to_video_only", test_push_frame_rate_applies_to_video_only},
    {"pull_unavailable", test_pull_unavailable},
    {"pull_is_idempotent", test_pull_is_idempotent},
    {"pull_resumes_after_failure", test_pull_resumes_after_failure},
    {"pull_rejects_escaping_paths", test_pull_rejects_escaping_paths},
    {"pull_keeps_unrelated_files_and_repairs_modified", test_pull_keeps_unrelated_files_and_repairs_modified},
    {"pull_rejects_unsafe_slugs", test_pull_rejects_unsafe_slugs},
    {"pool_isolates_failures", test_pool_isolates_failures},
    {"pool_cancellation", test_pool_cancellation},
    {"pool_aborts_on_credential_failure", test_pool_aborts_on_credential_failure},
    {"pool_progress_runs_unlocked", test_pool_progress_runs_unlocked},
  };
  return run_suite("transfer_engine", tests, argc, argv);
}
