#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace warden::common {

enum class ErrorKind {
  None,
  PolicyViolation,
  ToolExecution,
  TransientInfra,
  Schema,
  ConstraintViolation,
  CorruptCheckpoint,
  Cancelled,
  Internal,
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);
[[nodiscard]] ErrorKind error_kind_from_string(std::string_view value);

/// Only transient infrastructure failures are worth retrying.
[[nodiscard]] inline bool is_transient(const ErrorKind kind) {
  return kind == ErrorKind::TransientInfra;
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorKind::Internal, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind error_kind() const { return kind_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorKind::Internal, std::nullopt, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(kind == ErrorKind::None ? ErrorKind::Internal : kind, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) {
    return failure(status.error_kind(), status.error());
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind error_kind() const { return kind_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace warden::common
