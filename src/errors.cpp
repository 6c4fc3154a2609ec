#include "errors.hpp"

const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Usage: return "usage error";
    case ErrorKind::MalformedReference: return "malformed reference";
    case ErrorKind::MissingConfig: return "missing configuration";
    case ErrorKind::DatasetNotFoundLocally: return "dataset not found locally";
    case ErrorKind::RemoteDatasetNotFound: return "remote dataset not found";
    case ErrorKind::ReleaseNotFound: return "release not found";
    case ErrorKind::ReleaseUnavailable: return "release unavailable";
    case ErrorKind::ValidationError: return "validation error";
    case ErrorKind::NameTaken: return "name taken";
    case ErrorKind::EmptyFileSet: return "empty file set";
    case ErrorKind::Unauthenticated: return "unauthenticated";
    case ErrorKind::InvalidLogin: return "invalid login";
    case ErrorKind::Transport: return "transport error";
    case ErrorKind::Io: return "i/o error";
  }
  return "unknown error";
}

bool is_absence(ErrorKind kind) {
  return kind == ErrorKind::DatasetNotFoundLocally ||
         kind == ErrorKind::RemoteDatasetNotFound ||
         kind == ErrorKind::ReleaseNotFound;
}

bool is_credential_failure(ErrorKind kind) {
  return kind == ErrorKind::Unauthenticated || kind == ErrorKind::InvalidLogin;
}

std::string describe(const Failure& failure) {
  std::string out = to_string(failure.kind);
  if(!failure.subject.empty()) {
    out += " '" + failure.subject + "'";
  }
  if(!failure.message.empty()) {
    out += ": " + failure.message;
  }
  return out;
}

SyncError::SyncError(ErrorKind kind, std::string subject, const std::string& message)
  : SyncError(Failure{kind, std::move(subject), message}) {}

SyncError::SyncError(Failure failure)
  : std::runtime_error(describe(failure)),
    failure_(std::move(failure)) {}
