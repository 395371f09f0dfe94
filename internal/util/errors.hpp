#pragma once

#include <stdexcept>
#include <string>

namespace transcription::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// malformed input, e.g. an unparsable source URL
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// key collision on create
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ownership mismatch
class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// upstream transcription / summarization failure
class ProviderError : public std::runtime_error {
 public:
  explicit ProviderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// provider output that cannot be converted into the segment model
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace transcription::util
