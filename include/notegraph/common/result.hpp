#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace notegraph::common {

enum class ErrorCode {
  None,
  Unknown,
  MalformedBlob,
  EncodingFailed,
  NotFound,
  InvalidArgument,
  Storage,
  Io,
};

[[nodiscard]] inline const char *error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Unknown:
    return "unknown";
  case ErrorCode::MalformedBlob:
    return "malformed_blob";
  case ErrorCode::EncodingFailed:
    return "encoding_failed";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Storage:
    return "storage";
  case ErrorCode::Io:
    return "io";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(true, "", ErrorCode::None); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Unknown) {
    return Status(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), "", ErrorCode::None);
  }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Unknown) {
    return Result(false, std::nullopt, std::move(message), code);
  }
  template <typename U> static Result failure_from(const Result<U> &other) {
    return failure(other.error(), other.code());
  }
  static Result failure_from(const Status &status) {
    return failure(status.error(), status.code());
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(error_, code_);
  }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorCode code)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorCode code_;
};

} // namespace notegraph::common
