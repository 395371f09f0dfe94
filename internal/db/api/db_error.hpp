#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace transcription::db {

// NotFound and key collisions become the service-level errors the gRPC layer maps;
// anything else is an internal failure
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + (result.message.empty() ? std::string(ErrorCodeName(result.code)) : result.message);
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace transcription::db
