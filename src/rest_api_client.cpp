#include "rest_api_client.hpp"

#include <system_error>

#include "utils.hpp"

using json = nlohmann::json;

namespace {

std::string error_detail(const HttpResponse& response) {
  if(response.body.empty()) return "HTTP " + std::to_string(response.status);
  try {
    auto doc = json::parse(response.body);
    if(doc.is_object()) {
      if(doc.contains("errors")) return doc.at("errors").dump();
      if(doc.contains("error")) {
        const auto& e = doc.at("error");
        return e.is_string() ? e.get<std::string>() : e.dump();
      }
      if(doc.contains("message")) return doc.at("message").get<std::string>();
    }
  } catch(const json::exception&) {
    // plain-text body
  }
  return "HTTP " + std::to_string(response.status) + ": " + trim_copy(response.body.substr(0, 200));
}

uint64_t count_field(const json& j, const char* key) {
  if(!j.contains(key) || j.at(key).is_null()) return 0;
  return j.at(key).get<uint64_t>();
}

} // namespace

void raise_for_status(const HttpResponse& response, const std::string& subject, ErrorKind not_found_kind) {
  if(response.ok()) return;
  switch(response.status) {
    case 401:
    case 403:
      throw SyncError(ErrorKind::Unauthenticated, subject, error_detail(response));
    case 404:
      throw SyncError(not_found_kind, subject, error_detail(response));
    case 409:
      throw SyncError(ErrorKind::NameTaken, subject, error_detail(response));
    case 400:
    case 422:
      throw SyncError(ErrorKind::ValidationError, subject, error_detail(response));
    default:
      throw SyncError(ErrorKind::Transport, subject, error_detail(response));
  }
}

RestApiClient::RestApiClient(std::string base_url,
                             std::string api_key,
                             std::shared_ptr<Logger> logger,
                             HttpClient::Options http_options)
  : base_url_(std::move(base_url)),
    api_key_(std::move(api_key)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("api")),
    http_(std::move(http_options)) {
  while(!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string RestApiClient::api_url(const std::string& path) const {
  return base_url_ + "/api" + path;
}

std::string RestApiClient::dataset_path(const std::string& team_slug, const std::string& dataset_slug) const {
  return "/teams/" + HttpClient::url_encode(team_slug) + "/datasets/" + HttpClient::url_encode(dataset_slug);
}

HttpRequest RestApiClient::make_request(const std::string& method, const std::string& path) const {
  HttpRequest request;
  request.method = method;
  request.url = api_url(path);
  request.headers.emplace_back("Authorization", "ApiKey " + api_key_);
  return request;
}

json RestApiClient::call_json(HttpRequest request, const std::string& subject, ErrorKind not_found_kind) const {
  request.headers.emplace_back("Accept", "application/json");
  if(!request.body.empty()) {
    request.headers.emplace_back("Content-Type", "application/json");
  }
  logger_->debug("{} {}", request.method, request.url);
  auto response = http_.send(request);
  raise_for_status(response, subject, not_found_kind);
  if(response.body.empty()) return json();
  try {
    return json::parse(response.body);
  } catch(const json::exception& e) {
    throw SyncError(ErrorKind::Transport, subject, std::string("invalid JSON from service: ") + e.what());
  }
}

RemoteDataset RestApiClient::dataset_from_json(const std::string& team_slug, const json& j) {
  RemoteDataset ds;
  ds.id = j.value("id", int64_t{0});
  ds.team_slug = j.value("team_slug", team_slug);
  ds.dataset_slug = j.at("slug").get<std::string>();
  for(const auto* slug : {&ds.team_slug, &ds.dataset_slug}) {
    if(!is_path_safe_slug(*slug)) {
      throw SyncError(ErrorKind::ValidationError, *slug, "service returned a slug that is not a usable directory name");
    }
  }
  ds.name = j.value("name", ds.dataset_slug);
  ds.image_count = count_field(j, "num_images");
  ds.progress = j.contains("progress") && j.at("progress").is_number() ? j.at("progress").get<double>() : 0.0;
  return ds;
}

Release RestApiClient::release_from_json(const DatasetIdentifier& dataset, const json& j) {
  Release release;
  release.identifier = dataset;
  release.identifier.version = j.at("name").get<std::string>();
  if(j.contains("metadata") && j.at("metadata").is_object()) {
    const auto& meta = j.at("metadata");
    release.image_count = count_field(meta, "num_images");
    release.class_count = meta.contains("annotation_classes") && meta.at("annotation_classes").is_array()
      ? meta.at("annotation_classes").size()
      : count_field(meta, "num_classes");
  } else {
    release.image_count = count_field(j, "image_count");
    release.class_count = count_field(j, "class_count");
  }
  auto inserted = j.value("inserted_at", std::string());
  if(!parse_iso8601(inserted, release.export_date)) {
    release.export_date = std::chrono::system_clock::time_point{};
  }
  release.available = j.contains("download_url") && !j.at("download_url").is_null();
  if(j.contains("available") && j.at("available").is_boolean()) {
    release.available = j.at("available").get<bool>();
  }
  return release;
}

std::string RestApiClient::authenticate(const std::string& api_key) {
  HttpRequest request;
  request.method = "GET";
  request.url = api_url("/users/token_info");
  request.headers.emplace_back("Authorization", "ApiKey " + api_key);
  auto response = http_.send(request);
  if(response.status == 401 || response.status == 403) {
    throw SyncError(ErrorKind::InvalidLogin, base_url_, "Invalid API key");
  }
  raise_for_status(response, base_url_, ErrorKind::Transport);
  try {
    auto doc = json::parse(response.body);
    api_key_ = api_key;
    return doc.at("selected_team").at("slug").get<std::string>();
  } catch(const json::exception& e) {
    throw SyncError(ErrorKind::Transport, base_url_, std::string("unexpected token_info response: ") + e.what());
  }
}

RemoteDataset RestApiClient::create_dataset(const std::string& team_slug, const std::string& name) {
  auto request = make_request("POST", "/teams/" + HttpClient::url_encode(team_slug) + "/datasets");
  request.body = json{{"name", name}}.dump();
  auto doc = call_json(std::move(request), team_slug + "/" + name, ErrorKind::RemoteDatasetNotFound);
  return dataset_from_json(team_slug, doc);
}

Result<RemoteDataset> RestApiClient::get_remote_dataset(const DatasetIdentifier& id) {
  const auto team = id.team_or_empty();
  for(const auto& ds : list_remote_datasets(team)) {
    if(ds.dataset_slug == id.dataset_slug) {
      return Result<RemoteDataset>::success(ds);
    }
  }
  DatasetIdentifier bare = id;
  bare.version.reset();
  return Result<RemoteDataset>::fail(ErrorKind::RemoteDatasetNotFound, render(bare),
                                     "no such dataset at " + base_url_);
}

std::vector<RemoteDataset> RestApiClient::list_remote_datasets(const std::string& team_slug) {
  auto doc = call_json(make_request("GET", "/teams/" + HttpClient::url_encode(team_slug) + "/datasets"),
                       team_slug, ErrorKind::RemoteDatasetNotFound);
  std::vector<RemoteDataset> out;
  if(!doc.is_array()) return out;
  for(const auto& entry : doc) {
    out.push_back(dataset_from_json(team_slug, entry));
  }
  return out;
}

void RestApiClient::remove_dataset(const RemoteDataset& dataset) {
  call_json(make_request("PUT", dataset_path(dataset.team_slug, dataset.dataset_slug) + "/archive"),
            render(dataset.identifier()), ErrorKind::RemoteDatasetNotFound);
}

std::string RestApiClient::create_export(const RemoteDataset& dataset,
                                         const std::vector<int64_t>& class_ids,
                                         const std::string& name) {
  const auto subject = render(dataset.identifier());
  auto request = make_request("POST", dataset_path(dataset.team_slug, dataset.dataset_slug) + "/exports");
  json body = json::object();
  if(!name.empty()) body["name"] = name;
  if(!class_ids.empty()) body["annotation_class_ids"] = class_ids;
  body["include_url_token"] = false;
  request.body = body.dump();
  auto doc = call_json(std::move(request), subject, ErrorKind::RemoteDatasetNotFound);
  if(doc.is_object() && doc.contains("name") && doc.at("name").is_string()) {
    return doc.at("name").get<std::string>();
  }
  if(!name.empty()) return name;
  throw SyncError(ErrorKind::Transport, subject, "export response carried no release name");
}

std::vector<Release> RestApiClient::list_releases(const RemoteDataset& dataset) {
  auto doc = call_json(make_request("GET", dataset_path(dataset.team_slug, dataset.dataset_slug) + "/exports"),
                       render(dataset.identifier()), ErrorKind::RemoteDatasetNotFound);
  std::vector<Release> out;
  if(!doc.is_array()) return out;
  for(const auto& entry : doc) {
    out.push_back(release_from_json(dataset.identifier(), entry));
  }
  return out;
}

void RestApiClient::ensure_blob(const RemoteDataset& dataset, const std::filesystem::path& source, std::string& sha) {
  const auto key = source.string();
  std::shared_ptr<std::mutex> lock_for_source;
  {
    std::lock_guard<std::mutex> lock(blob_mutex_);
    auto& slot = blob_locks_[key];
    if(!slot) slot = std::make_shared<std::mutex>();
    lock_for_source = slot;
  }
  std::lock_guard<std::mutex> source_lock(*lock_for_source);
  {
    std::lock_guard<std::mutex> lock(blob_mutex_);
    auto it = blob_hashes_.find(key);
    if(it != blob_hashes_.end()) sha = it->second;
  }
  if(sha.empty()) {
    sha = sha256_file_hex(source);
    std::lock_guard<std::mutex> lock(blob_mutex_);
    blob_hashes_[key] = sha;
  }
  const auto blob_key = dataset.team_slug + "/" + dataset.dataset_slug + "@" + sha;
  {
    std::lock_guard<std::mutex> lock(blob_mutex_);
    if(uploaded_blobs_.count(blob_key)) return;
  }

  const auto blob_path = dataset_path(dataset.team_slug, dataset.dataset_slug) + "/blobs/" + sha;
  auto head = http_.send(make_request("HEAD", blob_path));
  if(head.status == 404) {
    auto upload = make_request("PUT", blob_path);
    upload.headers.emplace_back("Content-Type", "application/octet-stream");
    upload.body_file = source;
    logger_->debug("Uploading video container {} ({})", key, sha);
    raise_for_status(http_.send(upload), key, ErrorKind::RemoteDatasetNotFound);
  } else {
    raise_for_status(head, key, ErrorKind::RemoteDatasetNotFound);
  }
  std::lock_guard<std::mutex> lock(blob_mutex_);
  uploaded_blobs_.insert(blob_key);
}

void RestApiClient::upload_item(const RemoteDataset& dataset, const UploadItem& item) {
  const auto base = dataset_path(dataset.team_slug, dataset.dataset_slug);
  if(!item.frame) {
    auto request = make_request("PUT", base + "/items/" + HttpClient::url_encode(item.remote_name));
    request.headers.emplace_back("Content-Type", "application/octet-stream");
    request.body_file = item.source;
    raise_for_status(http_.send(request), item.source.string(), ErrorKind::RemoteDatasetNotFound);
    return;
  }

  std::string sha;
  ensure_blob(dataset, item.source, sha);
  auto request = make_request("POST", base + "/frames");
  request.body = json{
    {"name", item.remote_name},
    {"blob", sha},
    {"frame_index", item.frame->index},
    {"timestamp_ms", item.frame->timestamp_ms},
    {"fps", item.frame->fps},
    {"whole_video", item.frame->whole_video}
  }.dump();
  call_json(std::move(request), item.remote_name, ErrorKind::RemoteDatasetNotFound);
}

std::vector<ReleaseFile> RestApiClient::list_release_files(const Release& release) {
  const auto subject = render(release.identifier);
  auto doc = call_json(make_request("GET", dataset_path(release.identifier.team_or_empty(), release.identifier.dataset_slug) +
                                             "/exports/" + HttpClient::url_encode(release.name()) + "/files"),
                       subject, ErrorKind::ReleaseNotFound);
  std::vector<ReleaseFile> out;
  if(!doc.is_array()) return out;
  for(const auto& entry : doc) {
    ReleaseFile file;
    file.relative_path = entry.at("path").get<std::string>();
    file.size = count_field(entry, "size");
    file.sha256 = entry.value("sha256", std::string());
    out.push_back(std::move(file));
  }
  return out;
}

void RestApiClient::download_release_file(const Release& release,
                                          const ReleaseFile& file,
                                          const std::filesystem::path& destination) {
  auto request = make_request("GET", dataset_path(release.identifier.team_or_empty(), release.identifier.dataset_slug) +
                                       "/exports/" + HttpClient::url_encode(release.name()) +
                                       "/files/" + HttpClient::url_encode(file.relative_path));
  auto response = http_.send(request, destination);
  if(!response.ok()) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
    raise_for_status(response, render(release.identifier) + " " + file.relative_path, ErrorKind::ReleaseNotFound);
  }
}

std::string RestApiClient::dataset_report(const RemoteDataset& dataset, const std::string& granularity) {
  auto request = make_request("GET", dataset_path(dataset.team_slug, dataset.dataset_slug) +
                                       "/report?group_by=dataset,user&granularity=" + HttpClient::url_encode(granularity));
  request.headers.emplace_back("Accept", "text/csv");
  auto response = http_.send(request);
  raise_for_status(response, render(dataset.identifier()), ErrorKind::RemoteDatasetNotFound);
  return response.body;
}

std::string RestApiClient::dataset_url(const RemoteDataset& dataset) const {
  return base_url_ + "/datasets/" + std::to_string(dataset.id);
}
