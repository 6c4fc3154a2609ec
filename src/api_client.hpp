#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "errors.hpp"
#include "remote_types.hpp"

// Operations the synchronization core needs from the remote service.
// Implementations throw SyncError: RemoteDatasetNotFound/ReleaseNotFound with
// the missing name, Unauthenticated, InvalidLogin, ValidationError, NameTaken,
// or Transport. Identifiers passed in always carry a team slug.
class ApiClient {
public:
  virtual ~ApiClient() = default;

  // Returns the slug of the team the key belongs to.
  virtual std::string authenticate(const std::string& api_key) = 0;

  virtual RemoteDataset create_dataset(const std::string& team_slug, const std::string& name) = 0;
  virtual Result<RemoteDataset> get_remote_dataset(const DatasetIdentifier& id) = 0;
  virtual std::vector<RemoteDataset> list_remote_datasets(const std::string& team_slug) = 0;
  virtual void remove_dataset(const RemoteDataset& dataset) = 0;

  // Starts a server-side export; returns the release name it will carry.
  virtual std::string create_export(const RemoteDataset& dataset,
                                    const std::vector<int64_t>& class_ids,
                                    const std::string& name) = 0;
  virtual std::vector<Release> list_releases(const RemoteDataset& dataset) = 0;

  virtual void upload_item(const RemoteDataset& dataset, const UploadItem& item) = 0;

  virtual std::vector<ReleaseFile> list_release_files(const Release& release) = 0;
  virtual void download_release_file(const Release& release,
                                     const ReleaseFile& file,
                                     const std::filesystem::path& destination) = 0;

  virtual std::string dataset_report(const RemoteDataset& dataset, const std::string& granularity) = 0;
  virtual std::string dataset_url(const RemoteDataset& dataset) const = 0;
};
