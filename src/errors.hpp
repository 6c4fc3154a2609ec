#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind {
  Usage,
  MalformedReference,
  MissingConfig,
  DatasetNotFoundLocally,
  RemoteDatasetNotFound,
  ReleaseNotFound,
  ReleaseUnavailable,
  ValidationError,
  NameTaken,
  EmptyFileSet,
  Unauthenticated,
  InvalidLogin,
  Transport,
  Io
};

const char* to_string(ErrorKind kind);

// Absence kinds are expected outcomes and travel as Result values.
bool is_absence(ErrorKind kind);

// Credential failures end a whole transfer rather than a single file.
bool is_credential_failure(ErrorKind kind);

struct Failure {
  ErrorKind kind = ErrorKind::Transport;
  std::string subject;   // dataset/team/version the failure is about
  std::string message;
};

std::string describe(const Failure& failure);

class SyncError : public std::runtime_error {
public:
  SyncError(ErrorKind kind, std::string subject, const std::string& message);
  explicit SyncError(Failure failure);

  ErrorKind kind() const { return failure_.kind; }
  const std::string& subject() const { return failure_.subject; }
  const Failure& failure() const { return failure_; }

private:
  Failure failure_;
};

template<typename T>
class Result {
public:
  static Result success(T value) {
    Result r;
    r.value_ = std::move(value);
    return r;
  }

  static Result fail(ErrorKind kind, std::string subject, std::string message) {
    Result r;
    r.failure_ = Failure{kind, std::move(subject), std::move(message)};
    return r;
  }

  static Result fail(Failure failure) {
    Result r;
    r.failure_ = std::move(failure);
    return r;
  }

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const {
    if(!value_) throw SyncError(failure_);
    return *value_;
  }

  T& value() {
    if(!value_) throw SyncError(failure_);
    return *value_;
  }

  const Failure& failure() const { return failure_; }

private:
  Result() = default;

  std::optional<T> value_;
  Failure failure_;
};
