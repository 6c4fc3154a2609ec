#include "media_source.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>

#include <spdlog/fmt/fmt.h>

#include "errors.hpp"
#include "local_cache.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

uint64_t read_be(const unsigned char* p, std::size_t n) {
  uint64_t v = 0;
  for(std::size_t i = 0; i < n; ++i) v = (v << 8) | p[i];
  return v;
}

struct BoxHeader {
  std::string type;
  uint64_t payload_offset = 0;
  uint64_t end = 0;
};

bool read_box_header(std::ifstream& in, uint64_t offset, uint64_t limit, BoxHeader& out) {
  if(offset + 8 > limit) return false;
  unsigned char head[16];
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset));
  if(!in.read(reinterpret_cast<char*>(head), 8)) return false;
  uint64_t size = read_be(head, 4);
  out.type.assign(reinterpret_cast<const char*>(head + 4), 4);
  uint64_t header_size = 8;
  if(size == 1) {
    if(!in.read(reinterpret_cast<char*>(head + 8), 8)) return false;
    size = read_be(head + 8, 8);
    header_size = 16;
  } else if(size == 0) {
    size = limit - offset;
  }
  if(size < header_size || offset + size > limit) return false;
  out.payload_offset = offset + header_size;
  out.end = offset + size;
  return true;
}

bool find_child(std::ifstream& in, uint64_t begin, uint64_t end, const char* type, BoxHeader& out) {
  uint64_t offset = begin;
  BoxHeader box;
  while(read_box_header(in, offset, end, box)) {
    if(box.type == type) {
      out = box;
      return true;
    }
    offset = box.end;
  }
  return false;
}

bool is_image_brand(const std::string& brand) {
  return brand == "heic" || brand == "heix" || brand == "mif1" ||
         brand == "msf1" || brand == "avif";
}

} // namespace

ContainerKind sniff_container(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return ContainerKind::Unknown;
  std::array<unsigned char, 12> b{};
  in.read(reinterpret_cast<char*>(b.data()), static_cast<std::streamsize>(b.size()));
  const auto got = static_cast<std::size_t>(in.gcount());
  if(got >= 3 && b[0] == 0xFF && b[1] == 0xD8 && b[2] == 0xFF) return ContainerKind::Image;
  if(got >= 4 && b[0] == 0x89 && b[1] == 'P' && b[2] == 'N' && b[3] == 'G') return ContainerKind::Image;
  if(got >= 4 && b[0] == 0x1A && b[1] == 0x45 && b[2] == 0xDF && b[3] == 0xA3) return ContainerKind::MatroskaVideo;
  if(got >= 12 && std::memcmp(b.data(), "RIFF", 4) == 0) {
    if(std::memcmp(b.data() + 8, "AVI ", 4) == 0) return ContainerKind::AviVideo;
    if(std::memcmp(b.data() + 8, "WEBP", 4) == 0) return ContainerKind::Image;
  }
  if(got >= 12 && std::memcmp(b.data() + 4, "ftyp", 4) == 0) {
    std::string brand(reinterpret_cast<const char*>(b.data() + 8), 4);
    return is_image_brand(brand) ? ContainerKind::Image : ContainerKind::IsoBmffVideo;
  }
  return ContainerKind::Unknown;
}

std::optional<std::chrono::milliseconds> read_iso_bmff_duration(const fs::path& path) {
  std::error_code ec;
  const uint64_t file_size = fs::file_size(path, ec);
  if(ec) return std::nullopt;
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;

  BoxHeader moov;
  if(!find_child(in, 0, file_size, "moov", moov)) return std::nullopt;
  BoxHeader mvhd;
  if(!find_child(in, moov.payload_offset, moov.end, "mvhd", mvhd)) return std::nullopt;

  unsigned char body[32];
  in.clear();
  in.seekg(static_cast<std::streamoff>(mvhd.payload_offset));
  if(!in.read(reinterpret_cast<char*>(body), 1)) return std::nullopt;
  const unsigned version = body[0];
  const std::size_t needed = version == 1 ? 31 : 19; // flags, times, timescale, duration
  if(mvhd.payload_offset + 1 + needed > mvhd.end) return std::nullopt;
  if(!in.read(reinterpret_cast<char*>(body + 1), static_cast<std::streamsize>(needed))) return std::nullopt;

  uint64_t timescale = 0;
  uint64_t duration = 0;
  if(version == 1) {
    timescale = read_be(body + 20, 4);
    duration = read_be(body + 24, 8);
  } else {
    timescale = read_be(body + 12, 4);
    duration = read_be(body + 16, 4);
  }
  if(timescale == 0 || duration == 0 || duration == 0xFFFFFFFFu) return std::nullopt;
  const double ms = static_cast<double>(duration) * 1000.0 / static_cast<double>(timescale);
  if(ms >= static_cast<double>(std::numeric_limits<int64_t>::max())) return std::nullopt;
  return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

MediaSource classify(const fs::path& path) {
  switch(sniff_container(path)) {
    case ContainerKind::Image:
      return ImageSource{path};
    case ContainerKind::IsoBmffVideo:
      return VideoSource{path, read_iso_bmff_duration(path)};
    case ContainerKind::AviVideo:
    case ContainerKind::MatroskaVideo:
      return VideoSource{path, std::nullopt};
    case ContainerKind::Unknown:
      break;
  }
  auto ext = to_lower(path.extension().string());
  if(is_video_extension(ext)) {
    return VideoSource{path, std::nullopt};
  }
  return ImageSource{path};
}

const fs::path& source_path(const MediaSource& source) {
  return std::visit([](const auto& s) -> const fs::path& { return s.path; }, source);
}

std::vector<PlannedUpload> expand(const MediaSource& source, double fps) {
  std::vector<PlannedUpload> out;
  std::visit(overloaded{
    [&](const ImageSource& image) {
      UploadItem item;
      item.source = image.path;
      item.remote_name = image.path.filename().string();
      out.push_back(PlannedUpload{image.path.string(), std::move(item)});
    },
    [&](const VideoSource& video) {
      const auto name = video.path.filename().string();
      if(!video.duration || video.duration->count() <= 0) {
        UploadItem item;
        item.source = video.path;
        item.remote_name = name;
        item.frame = FrameRef{0, 0, fps, true};
        out.push_back(PlannedUpload{video.path.string(), std::move(item)});
        return;
      }
      const double seconds = static_cast<double>(video.duration->count()) / 1000.0;
      const double wanted = std::ceil(seconds * fps - 1e-9);
      if(wanted > static_cast<double>(kMaxFramesPerVideo)) {
        throw SyncError(ErrorKind::ValidationError, video.path.string(),
                        fmt::format("{:.0f} frames at {} fps exceeds the limit of {} per video; lower the frame rate",
                                    wanted, fps, kMaxFramesPerVideo));
      }
      const auto frames = std::max<uint64_t>(1, static_cast<uint64_t>(wanted));
      out.reserve(frames);
      for(uint64_t index = 0; index < frames; ++index) {
        UploadItem item;
        item.source = video.path;
        item.remote_name = fmt::format("{}/frame_{:06d}", name, index);
        item.frame = FrameRef{index, static_cast<uint64_t>(std::llround(index * 1000.0 / fps)), fps, false};
        out.push_back(PlannedUpload{fmt::format("{}#frame={}", video.path.string(), index), std::move(item)});
      }
    }
  }, source);
  return out;
}
