#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "api_client.hpp"
#include "errors.hpp"
#include "remote_types.hpp"

class CancellationToken;

// Read-through view over the service's releases; nothing is cached locally.

// Starts an export and returns at once with a pending (unavailable) release.
// An empty name lets the service choose one.
Release create_release(ApiClient& api,
                       const RemoteDataset& remote,
                       const std::vector<int64_t>& class_filter,
                       const std::optional<std::string>& name);

// All releases as reported, unavailable ones included, in service order.
std::vector<Release> list_releases(ApiClient& api, const RemoteDataset& remote);

void sort_by_export_date(std::vector<Release>& releases); // newest first
std::vector<Release> available_releases(const std::vector<Release>& releases);

// "latest" picks the newest available release (ties: greatest name); any other
// version must match a release name exactly.
Result<Release> select_version(const std::vector<Release>& releases,
                               const RemoteDataset& remote,
                               const std::string& version);
Result<Release> resolve_version(ApiClient& api, const RemoteDataset& remote, const std::string& version);

// Polls resolve_version until the release exists and is available.
Result<Release> wait_for_release(ApiClient& api,
                                 const RemoteDataset& remote,
                                 const std::string& version,
                                 std::chrono::milliseconds poll_interval,
                                 std::size_t max_attempts,
                                 const CancellationToken* cancel = nullptr);
