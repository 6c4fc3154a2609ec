#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "dataset_identifier.hpp"

struct RemoteDataset {
  int64_t id = 0;
  std::string team_slug;
  std::string dataset_slug;
  std::string name;
  uint64_t image_count = 0;
  double progress = 0.0; // completed annotation fraction, owned by the service

  DatasetIdentifier identifier() const {
    return DatasetIdentifier{team_slug, dataset_slug, std::nullopt};
  }
};

struct Release {
  DatasetIdentifier identifier; // version always populated
  uint64_t image_count = 0;
  uint64_t class_count = 0;
  std::chrono::system_clock::time_point export_date{};
  bool available = false;

  const std::string& name() const { return *identifier.version; }
};

// One file of a release as listed by the service. relative_path is relative to
// the local dataset root, e.g. "images/0001.jpg" or "releases/v1/annotations/0001.json".
struct ReleaseFile {
  std::string relative_path;
  uint64_t size = 0;
  std::string sha256; // empty when the service does not publish checksums
};

struct FrameRef {
  uint64_t index = 0;
  uint64_t timestamp_ms = 0;
  double fps = 0.0;
  bool whole_video = false; // duration unknown; the service extracts every frame at fps
};

struct UploadItem {
  std::filesystem::path source;
  std::string remote_name;
  std::optional<FrameRef> frame; // set for video frame-extraction tasks
};
