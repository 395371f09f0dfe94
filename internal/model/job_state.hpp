#pragma once

#include <string_view>

#include "transcription/manager/core/v1/types.pb.h"

namespace transcription::model {

using JobStatus = transcription::manager::core::v1::JobStatus;

constexpr bool IsTerminal(JobStatus status) {
  return status == transcription::manager::core::v1::JOB_STATUS_COMPLETED || status == transcription::manager::core::v1::JOB_STATUS_FAILED;
}

// live = counts against the one-live-job-per-key rule
constexpr bool IsLive(JobStatus status) {
  return status == transcription::manager::core::v1::JOB_STATUS_PENDING || status == transcription::manager::core::v1::JOB_STATUS_PROCESSING;
}

/*
  pending -> processing -> completed
                        -> failed

  pending may also fail directly when the job cannot be claimed (asset
  vanished, startup recovery). Terminal states never move.
*/
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  using namespace transcription::manager::core::v1;
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case JOB_STATUS_PROCESSING:
      return from == JOB_STATUS_PENDING;
    case JOB_STATUS_COMPLETED:
      return from == JOB_STATUS_PROCESSING;
    case JOB_STATUS_FAILED:
      return from == JOB_STATUS_PENDING || from == JOB_STATUS_PROCESSING;
    default:
      return false;
  }
}

constexpr std::string_view StatusName(JobStatus status) {
  using namespace transcription::manager::core::v1;
  switch (status) {
    case JOB_STATUS_PENDING:
      return "pending";
    case JOB_STATUS_PROCESSING:
      return "processing";
    case JOB_STATUS_COMPLETED:
      return "completed";
    case JOB_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace transcription::model
