#pragma once

#include <stdexcept>
#include <string>

namespace discovery::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised to operations still running against a channel that was shut down.
class ConnectionClosed : public std::runtime_error {
 public:
  explicit ConnectionClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport-level failure talking to a peer node (unreachable, timeout, reset).
class PeerUnavailable : public std::runtime_error {
 public:
  explicit PeerUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace discovery::util
