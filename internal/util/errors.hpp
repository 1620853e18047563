#pragma once

#include <stdexcept>
#include <string>

namespace gearledger::util {

/*
  Central error types.

  These get translated later to HTTP status codes (internal/http/http_error).
*/

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

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PayloadTooLarge : public std::runtime_error {
 public:
  explicit PayloadTooLarge(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace gearledger::util
