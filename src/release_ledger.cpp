#include "release_ledger.hpp"

#include <algorithm>
#include <iterator>
#include <thread>

#include "transfer_pool.hpp"

namespace {

DatasetIdentifier versioned(const RemoteDataset& remote, const std::string& version) {
  auto id = remote.identifier();
  id.version = version;
  return id;
}

} // namespace

Release create_release(ApiClient& api,
                       const RemoteDataset& remote,
                       const std::vector<int64_t>& class_filter,
                       const std::optional<std::string>& name) {
  if(name && !is_valid_release_name(*name)) {
    throw SyncError(ErrorKind::ValidationError, render(remote.identifier()),
                    "release name '" + *name + "' may only contain letters, digits, '-' and '_'");
  }
  auto assigned = api.create_export(remote, class_filter, name.value_or(std::string()));
  if(!is_valid_release_name(assigned)) {
    throw SyncError(ErrorKind::ValidationError, render(remote.identifier()),
                    "service assigned unusable release name '" + assigned + "'");
  }
  Release pending;
  pending.identifier = versioned(remote, assigned);
  pending.export_date = std::chrono::system_clock::now();
  pending.available = false;
  return pending;
}

std::vector<Release> list_releases(ApiClient& api, const RemoteDataset& remote) {
  return api.list_releases(remote);
}

void sort_by_export_date(std::vector<Release>& releases) {
  std::stable_sort(releases.begin(), releases.end(), [](const Release& a, const Release& b){
    return a.export_date > b.export_date;
  });
}

std::vector<Release> available_releases(const std::vector<Release>& releases) {
  std::vector<Release> out;
  std::copy_if(releases.begin(), releases.end(), std::back_inserter(out),
               [](const Release& r){ return r.available; });
  return out;
}

Result<Release> select_version(const std::vector<Release>& releases,
                               const RemoteDataset& remote,
                               const std::string& version) {
  const Release* chosen = nullptr;
  if(version == "latest") {
    for(const auto& release : releases) {
      if(!release.available) continue;
      if(!chosen ||
         release.export_date > chosen->export_date ||
         (release.export_date == chosen->export_date && release.name() > chosen->name())) {
        chosen = &release;
      }
    }
  } else {
    for(const auto& release : releases) {
      if(release.identifier.version && *release.identifier.version == version) {
        chosen = &release;
        break;
      }
    }
  }
  if(!chosen) {
    return Result<Release>::fail(ErrorKind::ReleaseNotFound, render(versioned(remote, version)),
                                 version == "latest" ? "no available release; export one first"
                                                     : "no release with that name");
  }
  return Result<Release>::success(*chosen);
}

Result<Release> resolve_version(ApiClient& api, const RemoteDataset& remote, const std::string& version) {
  return select_version(list_releases(api, remote), remote, version);
}

Result<Release> wait_for_release(ApiClient& api,
                                 const RemoteDataset& remote,
                                 const std::string& version,
                                 std::chrono::milliseconds poll_interval,
                                 std::size_t max_attempts,
                                 const CancellationToken* cancel) {
  bool seen_pending = false;
  for(std::size_t attempt = 0; attempt < std::max<std::size_t>(1, max_attempts); ++attempt) {
    if(attempt > 0) std::this_thread::sleep_for(poll_interval);
    if(cancel && cancel->cancelled()) break;
    auto result = resolve_version(api, remote, version);
    if(result && result.value().available) return result;
    if(result) seen_pending = true;
  }
  if(seen_pending) {
    return Result<Release>::fail(ErrorKind::ReleaseUnavailable, render(versioned(remote, version)),
                                 "release is still being generated");
  }
  return Result<Release>::fail(ErrorKind::ReleaseNotFound, render(versioned(remote, version)),
                               "release did not appear in time");
}
