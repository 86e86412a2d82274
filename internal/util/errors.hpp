#pragma once

#include <stdexcept>
#include <string>

namespace callscribe::util {

/*
  Central error types.

  Transport adapters translate these to gRPC status codes; the continuity
  controller maps them onto lifecycle outcomes.
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

// Network reads, session start: worth retrying with backoff.
class TransientError : public std::runtime_error {
 public:
  explicit TransientError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed container element. Never fatal to a stream.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Processing vetoed or source identity rejected: clean exit, no ERROR event.
class PolicyRejected : public std::runtime_error {
 public:
  explicit PolicyRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace callscribe::util
