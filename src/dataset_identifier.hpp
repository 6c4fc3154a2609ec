#pragma once

#include <optional>
#include <string>

// team/dataset:version coordinates of a dataset or one of its releases.
struct DatasetIdentifier {
  std::optional<std::string> team_slug;
  std::string dataset_slug;
  std::optional<std::string> version;

  static DatasetIdentifier parse(const std::string& reference);

  std::string str() const;
  std::string team_or_empty() const { return team_slug.value_or(std::string()); }

  bool operator==(const DatasetIdentifier& other) const {
    return team_slug == other.team_slug &&
           dataset_slug == other.dataset_slug &&
           version == other.version;
  }
  bool operator!=(const DatasetIdentifier& other) const { return !(*this == other); }
};

std::string render(const DatasetIdentifier& id);

// Fills a missing team slug from the active team. Throws SyncError(MissingConfig)
// when the identifier has no team and no active team is configured.
DatasetIdentifier with_team(const DatasetIdentifier& id, const std::string& active_team);

// Release names are used verbatim as identifier suffixes and path segments:
// [A-Za-z0-9_-]+
bool is_valid_release_name(const std::string& name);

// Team and dataset slugs name directories under the datasets root and must
// each be exactly one path segment.
bool is_path_safe_slug(const std::string& slug);
