#pragma once

#include <stdexcept>
#include <string>

namespace boolstab {

// Thrown by SignalRegistry::add() when the name is already registered.
class DuplicateNameError : public std::runtime_error {
public:
  explicit DuplicateNameError(const std::string& name)
      : std::runtime_error("Signal '" + name + "' already exists"), name_(name) {}

  const std::string& name() const { return name_; }

private:
  std::string name_;
};

// Thrown by any registry operation that references an unknown signal name.
class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::string& name)
      : std::runtime_error("Signal '" + name + "' does not exist"), name_(name) {}

  const std::string& name() const { return name_; }

private:
  std::string name_;
};

// Thrown when a threshold or buffer mode is out of range or unparseable.
class InvalidConfigurationError : public std::runtime_error {
public:
  explicit InvalidConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace boolstab
