#pragma once

#include <string>
#include <utility>

namespace transcription::db {

/*
  Backend-neutral outcome of a repository call. Backends map their native
  errors onto ErrorCode; nothing above db/ sees sqlite3 return codes.
*/
enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  // unique index or foreign key rejected the write, e.g. a second live job for one key
  ConstraintViolation,
  Busy,
  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "database busy";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "database corrupt";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace transcription::db
