#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "remote_types.hpp"

struct ImageSource {
  std::filesystem::path path;
};

struct VideoSource {
  std::filesystem::path path;
  std::optional<std::chrono::milliseconds> duration; // unset when the container could not be read
};

using MediaSource = std::variant<ImageSource, VideoSource>;

enum class ContainerKind { Unknown, Image, IsoBmffVideo, AviVideo, MatroskaVideo };

// Looks at the leading bytes only.
ContainerKind sniff_container(const std::filesystem::path& path);

// Reads moov/mvhd of an MP4/MOV file.
std::optional<std::chrono::milliseconds> read_iso_bmff_duration(const std::filesystem::path& path);

// Content sniff first, extension second; anything unrecognised is a static image.
MediaSource classify(const std::filesystem::path& path);

const std::filesystem::path& source_path(const MediaSource& source);

struct PlannedUpload {
  std::string label;
  UploadItem item;
};

constexpr uint64_t kMaxFramesPerVideo = 200000;

// Images become one upload; videos one frame-extraction upload per frame at fps,
// or a single whole-video extraction when the duration is unknown. Throws
// SyncError(ValidationError) naming the video when it would need more than
// kMaxFramesPerVideo frames.
std::vector<PlannedUpload> expand(const MediaSource& source, double fps);
