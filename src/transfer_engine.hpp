#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "local_cache.hpp"
#include "remote_types.hpp"
#include "sync_context.hpp"
#include "transfer_pool.hpp"

struct TransferRequest {
  // When set, the scan below is skipped and files_to_exclude is ignored.
  std::optional<std::set<std::filesystem::path>> files_to_upload;
  std::optional<std::set<std::filesystem::path>> files_to_exclude;
  double frame_rate = 1.0;
  std::filesystem::path source_root; // scan root; empty means the current directory
};

struct PullOutcome {
  LocalDataset dataset;
  TransferSummary summary;
};

// Candidate files for a push. Explicit lists are returned as given (absolute);
// otherwise supported media under source_root minus the exclusions.
std::vector<std::filesystem::path> collect_push_candidates(const TransferRequest& request);

// Candidates after the request checks push makes: SyncError(ValidationError)
// for frame_rate <= 0, SyncError(EmptyFileSet) when nothing is left. Touches
// only the local file system.
std::vector<std::filesystem::path> checked_push_candidates(const TransferRequest& request,
                                                           const std::string& subject);

// Throws SyncError(ValidationError) for frame_rate <= 0 and
// SyncError(EmptyFileSet) for an empty candidate set, both before any network
// call. Per-file upload failures are reported in the summary; a credential
// failure aborts the remaining uploads and is rethrown.
TransferSummary push(const SyncContext& ctx, const RemoteDataset& remote, const TransferRequest& request);

// Throws SyncError(ReleaseUnavailable) without touching the disk when the
// release is still being generated, and SyncError(ValidationError) when its
// slugs cannot name a directory under the datasets root. Precondition: no other pull writes to the
// same dataset directory concurrently.
PullOutcome pull(const SyncContext& ctx, const Release& release);

// <datasets_root>/<team>/<dataset>. Throws SyncError(ValidationError) for a
// missing team or a slug that is not a single path segment.
std::filesystem::path dataset_directory(const std::filesystem::path& datasets_root,
                                        const DatasetIdentifier& id);
