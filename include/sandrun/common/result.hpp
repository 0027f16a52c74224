#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sandrun::common {

enum class ErrorKind {
  Generic,
  LaunchError,
  HealthCheckTimeout,
  PoolExhausted,
  SandboxLost,
  ExecutionFault,
  NotReady,
  InvalidPayload,
  Cancelled,
  Storage,
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

class Status {
public:
  static Status success() { return Status(true, ErrorKind::Generic, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorKind::Generic, std::move(message));
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(false, kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, ErrorKind kind, std::string error)
      : ok_(ok), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorKind::Generic, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorKind::Generic, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, std::nullopt, kind, std::move(message));
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

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(kind_, error_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorKind kind, std::string error)
      : ok_(ok), value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

} // namespace sandrun::common
