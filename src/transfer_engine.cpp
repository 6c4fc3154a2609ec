#include "transfer_engine.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "media_source.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kMarkerDir = ".dsync";
constexpr const char* kMarkerFile = "release.json";
constexpr const char* kPartialSuffix = ".part";

fs::path normalize_path(const fs::path& p) {
  std::error_code ec;
  auto absolute = fs::absolute(p, ec);
  if(ec) absolute = p;
  auto canonical = fs::weakly_canonical(absolute, ec);
  if(ec) return absolute.lexically_normal();
  return canonical;
}

bool is_within(const fs::path& candidate, const fs::path& root) {
  auto mismatch = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
  return mismatch.first == root.end();
}

bool is_excluded(const fs::path& candidate, const std::vector<fs::path>& exclusions) {
  for(const auto& excluded : exclusions) {
    if(candidate == excluded || is_within(candidate, excluded)) return true;
  }
  return false;
}

bool is_supported_media(const fs::path& p) {
  auto ext = to_lower(p.extension().string());
  return is_image_extension(ext) || is_video_extension(ext);
}

// Release paths come from the service; refuse anything that would escape the
// dataset root. Only that file fails.
fs::path safe_relative(const std::string& relative) {
  fs::path rel = fs::path(relative).lexically_normal();
  if(rel.empty() || rel.is_absolute() || rel.has_root_name()) {
    throw SyncError(ErrorKind::Io, relative, "release file path must be relative");
  }
  for(const auto& part : rel) {
    if(part == "..") {
      throw SyncError(ErrorKind::Io, relative, "release file path leaves the dataset directory");
    }
  }
  if(*rel.begin() == kMarkerDir) {
    throw SyncError(ErrorKind::Io, relative, "release file path uses a reserved directory");
  }
  return rel;
}

bool matches_checksum(const fs::path& target, const ReleaseFile& file) {
  std::error_code ec;
  if(!fs::is_regular_file(target, ec)) return false;
  if(fs::file_size(target, ec) != file.size || ec) return false;
  if(file.sha256.empty()) return false;
  return to_lower(sha256_file_hex(target)) == to_lower(file.sha256);
}

void download_one(ApiClient& api, const Release& release, const ReleaseFile& file, const fs::path& dest_root) {
  const fs::path target = dest_root / safe_relative(file.relative_path);
  if(matches_checksum(target, file)) return;

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if(ec) {
    throw SyncError(ErrorKind::Io, target.parent_path().string(), ec.message());
  }
  fs::path partial = target;
  partial += kPartialSuffix;
  fs::remove(partial, ec);
  api.download_release_file(release, file, partial);

  if(!file.sha256.empty()) {
    auto got = sha256_file_hex(partial);
    if(to_lower(got) != to_lower(file.sha256)) {
      fs::remove(partial, ec);
      throw SyncError(ErrorKind::Transport, file.relative_path,
                      "checksum mismatch (expected " + file.sha256 + ", got " + got + ")");
    }
  }
  fs::rename(partial, target, ec);
  if(ec) {
    throw SyncError(ErrorKind::Io, target.string(), ec.message());
  }
}

void write_release_marker(const fs::path& dest_root, const Release& release, std::vector<ReleaseFile> files) {
  std::sort(files.begin(), files.end(), [](const ReleaseFile& a, const ReleaseFile& b){
    return a.relative_path < b.relative_path;
  });
  nlohmann::json doc;
  doc["release"] = release.name();
  doc["team"] = release.identifier.team_or_empty();
  doc["dataset"] = release.identifier.dataset_slug;
  doc["export_date"] = format_utc(release.export_date);
  doc["image_count"] = release.image_count;
  doc["class_count"] = release.class_count;
  doc["files"] = nlohmann::json::array();
  for(const auto& f : files) {
    doc["files"].push_back({{"path", f.relative_path}, {"size", f.size}, {"sha256", f.sha256}});
  }

  const fs::path dir = dest_root / kMarkerDir;
  std::error_code ec;
  fs::create_directories(dir, ec);
  const fs::path marker = dir / kMarkerFile;
  fs::path partial = marker;
  partial += kPartialSuffix;
  {
    std::ofstream out(partial, std::ios::trunc);
    if(!out) {
      throw SyncError(ErrorKind::Io, partial.string(), "unable to write release marker");
    }
    out << doc.dump(2) << "\n";
  }
  fs::rename(partial, marker, ec);
  if(ec) {
    throw SyncError(ErrorKind::Io, marker.string(), ec.message());
  }
}

} // namespace

fs::path dataset_directory(const fs::path& datasets_root, const DatasetIdentifier& id) {
  if(!id.team_slug || !is_path_safe_slug(*id.team_slug) || !is_path_safe_slug(id.dataset_slug)) {
    throw SyncError(ErrorKind::ValidationError, render(id),
                    "team and dataset slugs must each be a single directory name");
  }
  return datasets_root / *id.team_slug / id.dataset_slug;
}

std::vector<fs::path> collect_push_candidates(const TransferRequest& request) {
  std::vector<fs::path> out;
  if(request.files_to_upload) {
    for(const auto& p : *request.files_to_upload) {
      out.push_back(normalize_path(p));
    }
  } else {
    std::vector<fs::path> exclusions;
    if(request.files_to_exclude) {
      for(const auto& p : *request.files_to_exclude) exclusions.push_back(normalize_path(p));
    }
    const fs::path root = normalize_path(request.source_root.empty() ? fs::current_path() : request.source_root);
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator done;
    while(!ec && it != done) {
      const auto& entry = *it;
      if(entry.is_regular_file(ec) && is_supported_media(entry.path())) {
        auto candidate = normalize_path(entry.path());
        if(!is_excluded(candidate, exclusions)) out.push_back(candidate);
      }
      it.increment(ec);
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

std::vector<fs::path> checked_push_candidates(const TransferRequest& request, const std::string& subject) {
  if(!(request.frame_rate > 0.0)) {
    throw SyncError(ErrorKind::ValidationError, subject,
                    "frame rate must be positive (got " + std::to_string(request.frame_rate) + ")");
  }
  auto candidates = collect_push_candidates(request);
  if(candidates.empty()) {
    throw SyncError(ErrorKind::EmptyFileSet, subject, "no files found to upload");
  }
  return candidates;
}

TransferSummary push(const SyncContext& ctx, const RemoteDataset& remote, const TransferRequest& request) {
  const auto subject = render(remote.identifier());
  auto candidates = checked_push_candidates(request, subject);
  if(!ctx.api) {
    throw SyncError(ErrorKind::MissingConfig, subject, "no API client configured");
  }

  std::vector<TransferTask> tasks;
  std::size_t video_count = 0;
  for(const auto& path : candidates) {
    auto source = classify(path);
    if(std::holds_alternative<VideoSource>(source)) ++video_count;
    for(auto& planned : expand(source, request.frame_rate)) {
      auto api = ctx.api;
      auto item = std::move(planned.item);
      tasks.push_back(TransferTask{std::move(planned.label), [api, remote, item]{
        api->upload_item(remote, item);
      }});
    }
  }

  ctx.logger->info("Uploading {} file(s) ({} video, {} upload task(s)) to {}",
                   candidates.size(), video_count, tasks.size(), subject);
  auto summary = run_transfer_tasks(tasks, PoolConfig{ctx.max_workers}, ctx.cancel, ctx.progress);
  for(const auto& failure : summary.failed) {
    ctx.logger->warn("Upload of {} to {} failed: {}", failure.first, subject, failure.second);
  }
  if(!summary.cancelled.empty()) {
    ctx.logger->warn("{} upload task(s) to {} cancelled before starting", summary.cancelled.size(), subject);
  }
  ctx.logger->info("Push to {} finished: {} succeeded, {} failed", subject, summary.succeeded, summary.failed.size());
  return summary;
}

PullOutcome pull(const SyncContext& ctx, const Release& release) {
  const auto subject = render(release.identifier);
  if(!release.available) {
    throw SyncError(ErrorKind::ReleaseUnavailable, subject, "export is still being generated; try again later");
  }
  if(!release.identifier.team_slug) {
    throw SyncError(ErrorKind::MissingConfig, subject, "release identifier has no team");
  }
  if(!ctx.api) {
    throw SyncError(ErrorKind::MissingConfig, subject, "no API client configured");
  }

  PullOutcome outcome;
  outcome.dataset.team_slug = *release.identifier.team_slug;
  outcome.dataset.dataset_slug = release.identifier.dataset_slug;
  outcome.dataset.root_path = dataset_directory(ctx.datasets_root, release.identifier);

  auto files = ctx.api->list_release_files(release);

  std::error_code ec;
  fs::create_directories(outcome.dataset.root_path, ec);
  if(ec) {
    throw SyncError(ErrorKind::Io, outcome.dataset.root_path.string(), ec.message());
  }

  std::vector<TransferTask> tasks;
  tasks.reserve(files.size());
  const auto dest = outcome.dataset.root_path;
  for(const auto& file : files) {
    auto api = ctx.api;
    tasks.push_back(TransferTask{file.relative_path, [api, release, file, dest]{
      download_one(*api, release, file, dest);
    }});
  }

  ctx.logger->info("Pulling {} ({} file(s)) into {}", subject, files.size(), dest.string());
  outcome.summary = run_transfer_tasks(tasks, PoolConfig{ctx.max_workers}, ctx.cancel, ctx.progress);
  for(const auto& failure : outcome.summary.failed) {
    ctx.logger->warn("Download of {} from {} failed: {}", failure.first, subject, failure.second);
  }
  if(outcome.summary.ok()) {
    write_release_marker(dest, release, files);
  } else {
    ctx.logger->warn("Pull of {} incomplete; run it again to resume", subject);
  }
  return outcome;
}
