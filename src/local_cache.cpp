#include "local_cache.hpp"

#include <array>
#include <system_error>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool is_hidden(const fs::path& p) {
  auto name = p.filename().string();
  return !name.empty() && name.front() == '.';
}

bool is_plain_directory(const fs::directory_entry& entry) {
  std::error_code ec;
  if(entry.is_symlink(ec)) return false;
  return entry.is_directory(ec) && !is_hidden(entry.path());
}

} // namespace

bool is_image_extension(const std::string& ext) {
  static const std::array<const char*, 8> kImages = {
    ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp", ".dcm"
  };
  for(const auto* candidate : kImages) {
    if(ext == candidate) return true;
  }
  return false;
}

bool is_video_extension(const std::string& ext) {
  static const std::array<const char*, 6> kVideos = {
    ".mp4", ".m4v", ".mov", ".avi", ".mkv", ".webm"
  };
  for(const auto* candidate : kVideos) {
    if(ext == candidate) return true;
  }
  return false;
}

struct LocalDatasetRange::iterator::State {
  std::optional<std::string> team_filter;
  fs::directory_iterator teams;
  fs::directory_iterator datasets;
  std::string team_slug;
  bool in_team = false;
  LocalDataset current;
};

LocalDatasetRange::iterator::reference LocalDatasetRange::iterator::operator*() const {
  return state_->current;
}

LocalDatasetRange::iterator::pointer LocalDatasetRange::iterator::operator->() const {
  return &state_->current;
}

LocalDatasetRange::iterator::iterator(std::shared_ptr<State> state)
  : state_(std::move(state)) {
  advance();
}

LocalDatasetRange::iterator& LocalDatasetRange::iterator::operator++() {
  advance();
  return *this;
}

void LocalDatasetRange::iterator::advance() {
  if(!state_) return;
  auto& s = *state_;
  std::error_code ec;
  const fs::directory_iterator done;
  while(true) {
    if(s.in_team) {
      while(s.datasets != done) {
        fs::directory_entry entry = *s.datasets;
        s.datasets.increment(ec);
        if(ec) s.datasets = done;
        if(!is_plain_directory(entry)) continue;
        s.current = LocalDataset{entry.path(), s.team_slug, entry.path().filename().string()};
        return;
      }
      s.in_team = false;
    }
    if(s.teams == done) {
      state_.reset();
      return;
    }
    fs::directory_entry team = *s.teams;
    s.teams.increment(ec);
    if(ec) s.teams = done;
    if(!is_plain_directory(team)) continue;
    auto slug = team.path().filename().string();
    if(s.team_filter && *s.team_filter != slug) continue;
    s.datasets = fs::directory_iterator(team.path(), fs::directory_options::skip_permission_denied, ec);
    if(ec) continue;
    s.team_slug = slug;
    s.in_team = true;
  }
}

LocalDatasetRange::LocalDatasetRange(fs::path root, std::optional<std::string> team_filter)
  : root_(std::move(root)), team_filter_(std::move(team_filter)) {}

LocalDatasetRange::iterator LocalDatasetRange::begin() const {
  std::error_code ec;
  if(!fs::is_directory(root_, ec)) return end();
  auto state = std::make_shared<iterator::State>();
  state->team_filter = team_filter_;
  state->teams = fs::directory_iterator(root_, fs::directory_options::skip_permission_denied, ec);
  if(ec) return end();
  return iterator(std::move(state));
}

LocalDatasetRange list_local_datasets(const fs::path& datasets_root,
                                      const std::optional<std::string>& team_filter) {
  return LocalDatasetRange(datasets_root, team_filter);
}

namespace {

template<typename Visit>
void walk_regular_files(const fs::path& root, Visit&& visit) {
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if(ec) return;
  const fs::recursive_directory_iterator done;
  while(it != done) {
    const auto& entry = *it;
    auto status = entry.symlink_status(ec);
    if(!ec && fs::is_regular_file(status)) {
      visit(entry);
    }
    it.increment(ec);
    if(ec) break;
  }
}

} // namespace

DatasetSize dataset_size(const LocalDataset& ds) {
  DatasetSize out;
  walk_regular_files(ds.root_path, [&](const fs::directory_entry& entry){
    std::error_code ec;
    auto size = entry.file_size(ec);
    ++out.file_count;
    if(!ec) out.total_bytes += size;
  });
  return out;
}

DatasetStats dataset_stats(const LocalDataset& ds) {
  DatasetStats out;
  walk_regular_files(ds.root_path, [&](const fs::directory_entry& entry){
    std::error_code ec;
    auto size = entry.file_size(ec);
    ++out.size.file_count;
    if(!ec) out.size.total_bytes += size;
    if(is_image_extension(to_lower(entry.path().extension().string()))) ++out.image_count;
  });
  std::error_code ec;
  out.last_write = fs::last_write_time(ds.root_path, ec);
  return out;
}

Result<LocalDataset> locate(const fs::path& datasets_root, const DatasetIdentifier& id) {
  for(const auto& ds : list_local_datasets(datasets_root, id.team_slug)) {
    if(ds.dataset_slug == id.dataset_slug) {
      return Result<LocalDataset>::success(ds);
    }
  }
  return Result<LocalDataset>::fail(ErrorKind::DatasetNotFoundLocally, render(id),
                                    "not found under " + datasets_root.string());
}
