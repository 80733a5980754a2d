#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace nexarag::common {

enum class ErrorCode {
  Internal,
  Configuration,
  EmbeddingUnavailable,
  GenerationFailed,
  IndexIncompatible,
  UnsupportedFormat,
  NotFound,
  Io,
  Storage,
  Timeout,
  Unavailable,
  Cancelled,
};

[[nodiscard]] const char *error_code_name(ErrorCode code);

[[nodiscard]] bool is_retryable(ErrorCode code);

class Status {
public:
  static Status success() { return Status(true, ErrorCode::Internal, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorCode::Internal, std::move(message));
  }
  static Status error(ErrorCode code, std::string message) {
    return Status(false, code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorCode::Internal, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorCode::Internal, std::move(message));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(false, std::nullopt, code, std::move(message));
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

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

  template <typename U> [[nodiscard]] Result<U> forward_error() const {
    return Result<U>::failure(code_, error_);
  }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(code_, error_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorCode code, std::string error)
      : ok_(ok), value_(std::move(value)), code_(code), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorCode code_;
  std::string error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, ErrorCode::Internal, ""); }
  static Result failure(std::string message) {
    return Result(false, ErrorCode::Internal, std::move(message));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(false, code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

} // namespace nexarag::common
