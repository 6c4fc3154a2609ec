#include "dataset_identifier.hpp"

#include <cctype>

#include "errors.hpp"

namespace {

std::string escape_slug(const std::string& slug) {
  std::string out;
  out.reserve(slug.size());
  for(char ch : slug) {
    if(ch == '/' || ch == ':' || ch == '\\') out.push_back('\\');
    out.push_back(ch);
  }
  return out;
}

[[noreturn]] void malformed(const std::string& reference, const std::string& why) {
  throw SyncError(ErrorKind::MalformedReference, reference, why);
}

} // namespace

bool is_valid_release_name(const std::string& name) {
  if(name.empty()) return false;
  for(char ch : name) {
    if(std::isalnum(static_cast<unsigned char>(ch))) continue;
    if(ch == '-' || ch == '_') continue;
    return false;
  }
  return true;
}

bool is_path_safe_slug(const std::string& slug) {
  if(slug.empty() || slug == "." || slug == "..") return false;
  return slug.find_first_of("/\\") == std::string::npos;
}

DatasetIdentifier DatasetIdentifier::parse(const std::string& reference) {
  // Fields in order: team (only once a '/' is seen), dataset, version.
  std::string first;
  std::string dataset;
  std::string version;
  bool saw_slash = false;
  bool saw_colon = false;
  std::string* current = &first;

  for(std::size_t i = 0; i < reference.size(); ++i) {
    char ch = reference[i];
    if(ch == '\\') {
      if(i + 1 >= reference.size()) malformed(reference, "dangling escape character");
      current->push_back(reference[++i]);
      continue;
    }
    if(ch == '/') {
      if(saw_slash) malformed(reference, "more than one '/'");
      if(saw_colon) malformed(reference, "'/' after the version separator");
      saw_slash = true;
      current = &dataset;
      continue;
    }
    if(ch == ':') {
      if(saw_colon) malformed(reference, "more than one ':'");
      saw_colon = true;
      current = &version;
      continue;
    }
    current->push_back(ch);
  }

  DatasetIdentifier id;
  if(saw_slash) {
    if(first.empty()) malformed(reference, "empty team slug");
    id.team_slug = first;
    id.dataset_slug = dataset;
  } else {
    id.dataset_slug = first;
  }
  if(id.dataset_slug.empty()) malformed(reference, "empty dataset slug");
  if(saw_colon) {
    if(!is_valid_release_name(version)) {
      malformed(reference, "version must be non-empty and contain only letters, digits, '-' or '_'");
    }
    id.version = version;
  }
  return id;
}

std::string DatasetIdentifier::str() const {
  return render(*this);
}

std::string render(const DatasetIdentifier& id) {
  std::string out;
  if(id.team_slug) {
    out += escape_slug(*id.team_slug);
    out += '/';
  }
  out += escape_slug(id.dataset_slug);
  if(id.version) {
    out += ':';
    out += *id.version;
  }
  return out;
}

DatasetIdentifier with_team(const DatasetIdentifier& id, const std::string& active_team) {
  if(id.team_slug && !id.team_slug->empty()) return id;
  if(active_team.empty()) {
    throw SyncError(ErrorKind::MissingConfig, render(id),
                    "no team given and no default team configured; run 'dsync authenticate' or 'dsync team <slug>'");
  }
  DatasetIdentifier out = id;
  out.team_slug = active_team;
  return out;
}
