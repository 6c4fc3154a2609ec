#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "api_client.hpp"
#include "http_client.hpp"
#include "log.hpp"

// ApiClient over the service's JSON REST API. One instance per API key.
class RestApiClient : public ApiClient {
public:
  RestApiClient(std::string base_url,
                std::string api_key,
                std::shared_ptr<Logger> logger = nullptr,
                HttpClient::Options http_options = HttpClient::Options{});

  std::string authenticate(const std::string& api_key) override;

  RemoteDataset create_dataset(const std::string& team_slug, const std::string& name) override;
  Result<RemoteDataset> get_remote_dataset(const DatasetIdentifier& id) override;
  std::vector<RemoteDataset> list_remote_datasets(const std::string& team_slug) override;
  void remove_dataset(const RemoteDataset& dataset) override;

  std::string create_export(const RemoteDataset& dataset,
                            const std::vector<int64_t>& class_ids,
                            const std::string& name) override;
  std::vector<Release> list_releases(const RemoteDataset& dataset) override;

  void upload_item(const RemoteDataset& dataset, const UploadItem& item) override;

  std::vector<ReleaseFile> list_release_files(const Release& release) override;
  void download_release_file(const Release& release,
                             const ReleaseFile& file,
                             const std::filesystem::path& destination) override;

  std::string dataset_report(const RemoteDataset& dataset, const std::string& granularity) override;
  std::string dataset_url(const RemoteDataset& dataset) const override;

  static RemoteDataset dataset_from_json(const std::string& team_slug, const nlohmann::json& j);
  static Release release_from_json(const DatasetIdentifier& dataset, const nlohmann::json& j);

private:
  std::string api_url(const std::string& path) const;
  std::string dataset_path(const std::string& team_slug, const std::string& dataset_slug) const;
  HttpRequest make_request(const std::string& method, const std::string& path) const;
  nlohmann::json call_json(HttpRequest request, const std::string& subject, ErrorKind not_found_kind) const;
  void ensure_blob(const RemoteDataset& dataset, const std::filesystem::path& source, std::string& sha);

  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<Logger> logger_;
  HttpClient http_;

  std::mutex blob_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> blob_locks_;
  std::unordered_map<std::string, std::string> blob_hashes_;     // source path -> sha256
  std::unordered_set<std::string> uploaded_blobs_;               // team/dataset@sha256
};

// Raises the SyncError matching an unsuccessful response.
void raise_for_status(const HttpResponse& response, const std::string& subject, ErrorKind not_found_kind);
