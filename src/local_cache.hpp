#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

#include "dataset_identifier.hpp"
#include "errors.hpp"

// A dataset materialized under <datasets_root>/<team_slug>/<dataset_slug>/.
struct LocalDataset {
  std::filesystem::path root_path;
  std::string team_slug;
  std::string dataset_slug;

  DatasetIdentifier identifier() const {
    return DatasetIdentifier{team_slug, dataset_slug, std::nullopt};
  }
};

struct DatasetSize {
  uint64_t file_count = 0;
  uint64_t total_bytes = 0;
};

struct DatasetStats {
  DatasetSize size;
  uint64_t image_count = 0;
  std::filesystem::file_time_type last_write{};
};

// Lazy walk of <root>/<team>/<dataset>. Every begin() walks the tree again;
// entries come in directory enumeration order.
class LocalDatasetRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = LocalDataset;
    using difference_type = std::ptrdiff_t;
    using pointer = const LocalDataset*;
    using reference = const LocalDataset&;

    iterator() = default;

    reference operator*() const;
    pointer operator->() const;
    iterator& operator++();
    void operator++(int) { ++*this; }

    bool operator==(const iterator& other) const { return state_ == other.state_; }
    bool operator!=(const iterator& other) const { return !(*this == other); }

  private:
    friend class LocalDatasetRange;
    struct State;
    explicit iterator(std::shared_ptr<State> state);
    void advance();

    std::shared_ptr<State> state_;
  };

  LocalDatasetRange(std::filesystem::path root, std::optional<std::string> team_filter);

  iterator begin() const;
  iterator end() const { return iterator(); }

private:
  std::filesystem::path root_;
  std::optional<std::string> team_filter_;
};

LocalDatasetRange list_local_datasets(const std::filesystem::path& datasets_root,
                                      const std::optional<std::string>& team_filter = std::nullopt);

// Regular files only; symbolic links are neither followed nor counted.
DatasetSize dataset_size(const LocalDataset& ds);
DatasetStats dataset_stats(const LocalDataset& ds);

Result<LocalDataset> locate(const std::filesystem::path& datasets_root, const DatasetIdentifier& id);

bool is_image_extension(const std::string& lowered_extension);
bool is_video_extension(const std::string& lowered_extension);
