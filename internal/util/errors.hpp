#pragma once

#include <stdexcept>
#include <string>

namespace collab::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

// A single-flight operation (rebuild, trend refresh) is already in progress.
class AlreadyRunning : public std::runtime_error {
 public:
  explicit AlreadyRunning(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The store stayed unavailable after the bounded number of retries.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace collab::util
