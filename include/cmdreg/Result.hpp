#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace cmdreg {

enum class ErrorKind : int {
  LeafCollision = 1
};

struct Error {
  ErrorKind kind = ErrorKind::LeafCollision;
  std::string message;
  std::string name;               // top-level name that blocks the path
  std::vector<std::string> path;  // attempted subpath below `name`

  std::string describe() const {
    return name + ": " + message;
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

// ok | error(message)
using Status = Result<std::monostate>;

inline Status ok() { return Status(std::monostate{}); }

// Lifecycle faults. These are thrown, not returned.
class TableExistsError : public std::runtime_error {
public:
  explicit TableExistsError(const std::string& name)
    : std::runtime_error("table already exists: " + name) {}
};

class TableNotFoundError : public std::runtime_error {
public:
  explicit TableNotFoundError(const std::string& name)
    : std::runtime_error("no such table: " + name) {}
};

class TableClosedError : public std::runtime_error {
public:
  explicit TableClosedError(const std::string& name)
    : std::runtime_error("table is closed: " + name) {}
};

class TableAccessError : public std::runtime_error {
public:
  explicit TableAccessError(const std::string& name)
    : std::runtime_error("table is not writable from this thread: " + name) {}
};

} // namespace cmdreg
