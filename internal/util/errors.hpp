#pragma once

#include <stdexcept>
#include <string>

namespace freight::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed or out-of-policy input. Rejected synchronously, never retried.
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {
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

// A compare-and-swap lost a race. Callers retry the whole operation with refreshed state.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A bid arrived after the auction window closed.
class AuctionClosed : public std::runtime_error {
 public:
  explicit AuctionClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace freight::util
