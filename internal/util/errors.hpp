#pragma once

#include <stdexcept>
#include <string>

namespace settleup::util {

/*
  Central error types.

  Validation failures surface as InvalidArgument before anything is
  persisted; store failures are translated from db::Result codes.
*/

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace settleup::util
