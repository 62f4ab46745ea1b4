#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace grace {

struct Error {
  std::string message;
  std::string path;

  std::string describe() const {
    if (path.empty()) return message;
    return path + ": " + message;
  }
};

template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }

private:
  std::variant<T, Error> _value;
};

// Result without a value: either ok or an Error.
class Status {
public:
  Status() = default;
  Status(const Error& error) : _error(error) {}
  Status(Error&& error) : _error(std::move(error)) {}

  static Status failure(std::string message) {
    return Status(Error{std::move(message), {}});
  }

  bool ok() const { return !_error.has_value(); }
  explicit operator bool() const { return ok(); }

  const Error& error() const { return *_error; }

private:
  std::optional<Error> _error;
};

} // namespace grace
